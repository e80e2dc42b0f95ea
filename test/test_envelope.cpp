#include "zerofpr/zerofpr.hpp"
#include <catch2/catch.hpp>

#include <vector>

TEST_CASE("Envelope of a hand-computed example", "[envelope]")
{
    std::vector<double> const grad = {1.0, 2.0};
    std::vector<double> const x    = {1.0, 1.0};
    std::vector<double> const xbar = {0.0, 1.0};
    std::vector<double>       r(2);

    auto const e = ::ZEROFPR_NAMESPACE::detail::evaluate_envelope(
        /*f_x=*/2.0, grad, x, xbar, /*g_xbar=*/0.5, /*gamma=*/0.5, r);
    REQUIRE(r == std::vector<double>{1.0, 0.0});
    REQUIRE(e.normfpr == Approx(1.0));
    // 2 - ⟨(1, 2), (1, 0)⟩ + 1/(2·0.5)
    REQUIRE(e.uppbnd == Approx(2.0));
    REQUIRE(e.fbe == Approx(2.5));
}

TEST_CASE("Envelope at a fixed point equals the cost", "[envelope]")
{
    std::vector<double> const grad = {3.0, -1.0, 7.0};
    std::vector<double> const x    = {0.1, 0.2, 0.3};
    std::vector<double>       r(3);

    auto const e = ::ZEROFPR_NAMESPACE::detail::evaluate_envelope(
        1.25, grad, x, x, 0.75, 0.1, r);
    REQUIRE(e.normfpr == 0.0);
    REQUIRE(e.uppbnd == 1.25);
    REQUIRE(e.fbe == 2.0);
}

TEST_CASE("Envelope is deterministic", "[envelope]")
{
    std::vector<double> const grad = {0.3, -1.7, 2.9, 1e-3};
    std::vector<double> const x    = {1.0 / 3.0, 2.0 / 7.0, -5.0, 11.0};
    std::vector<double> const xbar = {0.1, 0.2, -4.9, 10.5};
    std::vector<double>       r1(4);
    std::vector<double>       r2(4);

    auto const e1 = ::ZEROFPR_NAMESPACE::detail::evaluate_envelope(
        3.14, grad, x, xbar, 0.2, 0.37, r1);
    auto const e2 = ::ZEROFPR_NAMESPACE::detail::evaluate_envelope(
        3.14, grad, x, xbar, 0.2, 0.37, r2);
    REQUIRE(r1 == r2);
    REQUIRE(e1.normfpr == e2.normfpr);
    REQUIRE(e1.uppbnd == e2.uppbnd);
    REQUIRE(e1.fbe == e2.fbe);
}
