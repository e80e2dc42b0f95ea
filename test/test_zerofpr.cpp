#include "zerofpr/prox.hpp"
#include "zerofpr/zerofpr.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace zerofpr = ::ZEROFPR_NAMESPACE;

namespace {
auto quiet_params() -> zerofpr::zerofpr_param_t
{
    zerofpr::zerofpr_param_t params;
    params.verbose = zerofpr::verbosity_t::off;
    return params;
}

auto random_matrix(size_t const rows, size_t const cols, unsigned const seed)
    -> zerofpr::dense_matrix_t
{
    std::mt19937                     gen{seed};
    std::normal_distribution<double> dist;
    std::vector<double>              data(rows * cols);
    for (auto& x : data) {
        x = dist(gen);
    }
    return zerofpr::dense_matrix_t{rows, cols, std::move(data)};
}

auto random_vector(size_t const n, unsigned const seed) -> std::vector<double>
{
    std::mt19937                     gen{seed};
    std::normal_distribution<double> dist;
    std::vector<double>              v(n);
    for (auto& x : v) {
        x = dist(gen);
    }
    return v;
}

/// Linear operator which counts how often it is applied.
struct counting_matrix_t {
    static constexpr auto kind = zerofpr::operator_kind_t::linear;

    zerofpr::dense_matrix_t matrix;
    mutable unsigned        calls;

    auto rows() const noexcept { return matrix.rows(); }
    auto cols() const noexcept { return matrix.cols(); }

    auto apply(gsl::span<double const> x, gsl::span<double> y) const -> void
    {
        ++calls;
        matrix.apply(x, y);
    }

    auto apply_adjoint(gsl::span<double const> y, gsl::span<double> x) const
        -> void
    {
        ++calls;
        matrix.apply_adjoint(y, x);
    }
};

struct counting_prox_t {
    zerofpr::norm_l1_fn g;
    unsigned            calls;

    auto operator()(gsl::span<double const> v, double const gamma,
                    gsl::span<double> out) -> double
    {
        ++calls;
        return g(v, gamma, out);
    }
};
} // namespace

TEST_CASE("Identity operator without regulariser", "[zerofpr]")
{
    auto const          A  = zerofpr::dense_matrix_t::identity(2);
    std::vector<double> x0 = {5.0, 5.0};
    auto const r = zerofpr::minimize(A, zerofpr::zero_fn{}, quiet_params(), x0);
    REQUIRE(r.status == zerofpr::status_t::success);
    REQUIRE(r.cost == Approx(0.0).margin(1e-12));
    REQUIRE(x0[0] == Approx(0.0).margin(1e-6));
    REQUIRE(x0[1] == Approx(0.0).margin(1e-6));
    REQUIRE(r.num_gamma_failures == 0);
    REQUIRE(r.num_tau_failures == 0);
}

TEST_CASE("Soft thresholding of a shifted identity", "[zerofpr]")
{
    zerofpr::affine_t const A{zerofpr::dense_matrix_t::identity(2),
                              std::vector<double>{3.0, 0.0}};
    for (auto& x0 : std::vector<std::vector<double>>{
             {0.0, 0.0}, {-10.0, 4.0}, {2.0, 0.0}, {100.0, -100.0}}) {
        auto const r = zerofpr::minimize(A, zerofpr::norm_l1_fn{1.0},
                                         quiet_params(), x0);
        REQUIRE(r.status == zerofpr::status_t::success);
        REQUIRE(x0[0] == Approx(2.0));
        REQUIRE(x0[1] == Approx(0.0).margin(1e-8));
        // ½·1² + 1·2
        REQUIRE(r.cost == Approx(2.5));
    }
}

TEST_CASE("Zero iterations", "[zerofpr]")
{
    auto const          A      = zerofpr::dense_matrix_t::identity(2);
    auto                params = quiet_params();
    std::vector<double> x0     = {5.0, 5.0};
    params.max_iter            = 0;
    auto const r = zerofpr::minimize(A, zerofpr::zero_fn{}, params, x0);
    REQUIRE(r.status == zerofpr::status_t::too_many_iterations);
    REQUIRE(r.num_iter == 0);
    // γ ≈ 0.95, so x̄ = x - γ·x ≈ 0.05·x
    REQUIRE(r.gamma == Approx(0.95).epsilon(1e-6));
    REQUIRE(x0[0] == Approx(0.25).epsilon(1e-5));
    REQUIRE(x0[1] == Approx(0.25).epsilon(1e-5));
    // A·x and Aᵗ·A·x, the same for the finite difference, and A·x̄
    REQUIRE(r.num_matvec == 5);
    REQUIRE(r.num_prox == 1);
}

TEST_CASE("Zero operator", "[zerofpr]")
{
    auto const          A  = zerofpr::dense_matrix_t::zeros(2, 2);
    std::vector<double> x0 = {1.0, -2.0};
    auto const r = zerofpr::minimize(A, zerofpr::zero_fn{}, quiet_params(), x0);
    REQUIRE(r.status == zerofpr::status_t::success);
    REQUIRE(r.num_iter == 0);
    REQUIRE(r.normfpr == 0.0);
    // L = 0 is replaced by 1
    REQUIRE(r.gamma == Approx(0.95));
    REQUIRE(std::isfinite(r.gamma));
    REQUIRE(x0 == std::vector<double>{1.0, -2.0});
    REQUIRE(r.num_matvec == 5);
    REQUIRE(r.num_prox == 1);
}

TEST_CASE("Least squares", "[zerofpr]")
{
    // AᵗA = [2 1; 1 5], Aᵗb = [4; 7]
    zerofpr::affine_t const A{
        zerofpr::dense_matrix_t{3, 2, {1.0, 0.0, 0.0, 2.0, 1.0, 1.0}},
        std::vector<double>{1.0, 2.0, 3.0}};
    auto params = quiet_params();
    params.tol  = 1e-12;
    for (auto m : {0U, 1U, 5U}) {
        params.m               = m;
        std::vector<double> x0 = {0.0, 0.0};
        auto const r = zerofpr::minimize(A, zerofpr::zero_fn{}, params, x0);
        REQUIRE(r.status == zerofpr::status_t::success);
        REQUIRE(x0[0] == Approx(13.0 / 9.0));
        REQUIRE(x0[1] == Approx(10.0 / 9.0));
    }
}

TEST_CASE("Nonnegative least squares", "[zerofpr]")
{
    zerofpr::affine_t const A{zerofpr::dense_matrix_t::identity(2),
                              std::vector<double>{-1.0, 2.0}};
    std::vector<double>     x0 = {1.0, 1.0};
    auto const r = zerofpr::minimize(A, zerofpr::indicator_nonneg_fn{},
                                     quiet_params(), x0);
    REQUIRE(r.status == zerofpr::status_t::success);
    REQUIRE(x0[0] == Approx(0.0).margin(1e-8));
    REQUIRE(x0[1] == Approx(2.0));
}

TEST_CASE("Sparse least squares with ℓ₀ penalty", "[zerofpr]")
{
    zerofpr::affine_t const A{zerofpr::dense_matrix_t::identity(2),
                              std::vector<double>{3.0, 0.1}};
    std::vector<double>     x0 = {0.0, 0.0};
    auto const r =
        zerofpr::minimize(A, zerofpr::norm_l0_fn{0.5}, quiet_params(), x0);
    REQUIRE(r.status == zerofpr::status_t::success);
    REQUIRE(x0[0] == Approx(3.0));
    REQUIRE(x0[1] == 0.0);
}

TEST_CASE("Lasso optimality conditions", "[zerofpr]")
{
    auto const          rows   = size_t{40};
    auto const          cols   = size_t{15};
    auto const          lambda = 2.0;
    zerofpr::affine_t const A{random_matrix(rows, cols, 1234),
                              random_vector(rows, 5678)};
    auto params = quiet_params();
    params.tol  = 1e-10;
    std::vector<double> x(cols, 0.0);
    auto const r =
        zerofpr::minimize(A, zerofpr::norm_l1_fn{lambda}, params, x);
    REQUIRE(r.status == zerofpr::status_t::success);

    // 0 ∈ Aᵗ(Ax - b) + λ∂‖x‖₁
    std::vector<double> residual(rows);
    std::vector<double> gradient(cols);
    A.apply(x, residual);
    A.apply_adjoint(residual, gradient);
    for (auto i = size_t{0}; i < cols; ++i) {
        if (x[i] == 0.0) { REQUIRE(std::abs(gradient[i]) <= lambda + 1e-6); }
        else {
            REQUIRE(gradient[i]
                    == Approx(-lambda * std::copysign(1.0, x[i])).margin(1e-6));
        }
    }
}

TEST_CASE("Counters match the number of calls", "[zerofpr]")
{
    zerofpr::affine_t const A{counting_matrix_t{random_matrix(30, 10, 42), 0},
                              random_vector(30, 43)};
    counting_prox_t         prox{zerofpr::norm_l1_fn{0.5}, 0};
    std::vector<double>     x(10, 1.0);
    auto const r = zerofpr::minimize(A, prox, quiet_params(), x);
    REQUIRE(r.status == zerofpr::status_t::success);
    REQUIRE(r.num_iter > 0);
    REQUIRE(r.num_matvec == A.linear().calls);
    REQUIRE(r.num_prox == prox.calls);

    SECTION("with a fixed step size there is no Lipschitz estimate")
    {
        auto params  = quiet_params();
        params.gamma = 1e-3;
        A.linear().calls = 0;
        prox.calls       = 0;
        std::vector<double> y(10, 1.0);
        params.max_iter = 0;
        auto const s    = zerofpr::minimize(A, prox, params, y);
        REQUIRE(s.num_matvec == 3);
        REQUIRE(A.linear().calls == 3);
        REQUIRE(s.num_prox == 1);
        REQUIRE(s.gamma == 1e-3);
    }
}

TEST_CASE("Step size never increases", "[zerofpr]")
{
    zerofpr::affine_t const A{random_matrix(40, 20, 7), random_vector(40, 8)};
    auto params  = quiet_params();
    // Much larger than 1/L, so that the γ search has work to do
    params.gamma = 10.0;
    std::vector<double> gammas;
    std::vector<double> products;
    auto const          halt = [&](zerofpr::zerofpr_state_t const& state,
                          double const normfpr_0, double, double) {
        gammas.push_back(state.gamma);
        products.push_back(state.gamma * state.sigma);
        return zerofpr::normfpr_small_enough_fn{1e-8}(state, normfpr_0, 0.0,
                                                      0.0);
    };
    std::vector<double> x(20, 0.0);
    auto const r = zerofpr::minimize(A, zerofpr::norm_l1_fn{0.1}, params, x, halt);
    REQUIRE(r.status == zerofpr::status_t::success);
    REQUIRE(gammas.size() >= 2);
    REQUIRE(r.gamma < 10.0);
    for (auto i = size_t{1}; i < gammas.size(); ++i) {
        REQUIRE(gammas[i] <= gammas[i - 1]);
    }
    for (auto const p : products) {
        REQUIRE(p == Approx(params.beta / 4.0));
    }
}

TEST_CASE("Accepted steps decrease the envelope", "[zerofpr]")
{
    zerofpr::affine_t const A{random_matrix(25, 12, 99), random_vector(25, 98)};
    auto                    params = quiet_params();
    auto                    checked = 0U;
    auto                    failures = 0U;
    auto const halt = [&](zerofpr::zerofpr_state_t const& state,
                          double const normfpr_0, double const fbe_curr,
                          double const fbe_prev) {
        if (state.iteration > 0) {
            if (state.num_tau_failures == failures) {
                REQUIRE(state.fbe_trial <= state.level);
                REQUIRE(state.level <= fbe_curr);
                ++checked;
            }
            failures = state.num_tau_failures;
        }
        REQUIRE(fbe_curr == state.fbe);
        REQUIRE((state.iteration == 0) == std::isnan(fbe_prev));
        return state.normfpr <= 1e-8 * std::max(1.0, normfpr_0);
    };
    std::vector<double> x(12, 0.0);
    auto const r = zerofpr::minimize(A, zerofpr::norm_l1_fn{1.0}, params, x, halt);
    REQUIRE(r.status == zerofpr::status_t::success);
    REQUIRE(checked > 0);
}

TEST_CASE("Invalid parameters", "[zerofpr]")
{
    auto const                A = zerofpr::dense_matrix_t::identity(2);
    std::vector<double> const x0 = {1.0, 2.0};

    auto const check = [&](auto&& modify, zerofpr::status_t const expected) {
        auto params = quiet_params();
        modify(params);
        auto       x = x0;
        auto const r = zerofpr::minimize(A, zerofpr::zero_fn{}, params, x);
        REQUIRE(r.status == expected);
        REQUIRE(r.num_iter == 0);
        REQUIRE(r.num_matvec == 0);
        REQUIRE(x == x0);
    };
    using zerofpr::status_t;
    using param_t = zerofpr::zerofpr_param_t;
    check([](param_t& p) { p.tol = 0.0; }, status_t::invalid_tolerance);
    check([](param_t& p) { p.tol = -1.0; }, status_t::invalid_tolerance);
    check([](param_t& p) { p.tol = std::nan(""); },
          status_t::invalid_tolerance);
    check([](param_t& p) { p.gamma = -1.0; }, status_t::invalid_step_size);
    check([](param_t& p) { p.gamma = 0.0; }, status_t::invalid_step_size);
    check([](param_t& p) { p.beta = 0.0; }, status_t::invalid_beta);
    check([](param_t& p) { p.beta = 1.0; }, status_t::invalid_beta);
    check([](param_t& p) { p.max_gamma_trials = 0; },
          status_t::invalid_trial_budget);
    check([](param_t& p) { p.max_tau_trials = 0; },
          status_t::invalid_trial_budget);
    check([](param_t& p) { p.tau_shrink = 1.0; },
          status_t::invalid_shrink_factor);
    check([](param_t& p) { p.tau_shrink = 0.0; },
          status_t::invalid_shrink_factor);
    check(
        [](param_t& p) {
            p.verbose      = zerofpr::verbosity_t::periodic;
            p.report_every = 0;
        },
        status_t::invalid_report_interval);
}

TEST_CASE("Dimension mismatch", "[zerofpr]")
{
    auto const          A = zerofpr::dense_matrix_t::zeros(2, 3);
    std::vector<double> x = {1.0, 2.0};
    auto const r = zerofpr::minimize(A, zerofpr::zero_fn{}, quiet_params(), x);
    REQUIRE(r.status == zerofpr::status_t::dimension_mismatch);
    REQUIRE(x == std::vector<double>{1.0, 2.0});

    auto const          B = zerofpr::dense_matrix_t::zeros(0, 0);
    std::vector<double> y;
    auto const s = zerofpr::minimize(B, zerofpr::zero_fn{}, quiet_params(), y);
    REQUIRE(s.status == zerofpr::status_t::invalid_argument);
}

TEST_CASE("Non-finite values are fatal", "[zerofpr]")
{
    SECTION("in the operator")
    {
        zerofpr::dense_matrix_t const A{
            2, 2, {1.0, std::numeric_limits<double>::quiet_NaN(), 0.0, 1.0}};
        std::vector<double> x = {1.0, 1.0};
        auto const          r =
            zerofpr::minimize(A, zerofpr::zero_fn{}, quiet_params(), x);
        REQUIRE(r.status == zerofpr::status_t::non_finite_value);
        REQUIRE(x == std::vector<double>{1.0, 1.0});
    }
    SECTION("in the regulariser")
    {
        auto const A    = zerofpr::dense_matrix_t::identity(2);
        auto const prox = [](gsl::span<double const> v, double,
                             gsl::span<double> out) {
            std::copy(v.begin(), v.end(), out.begin());
            return std::numeric_limits<double>::infinity();
        };
        std::vector<double> x = {1.0, 1.0};
        auto const r = zerofpr::minimize(A, prox, quiet_params(), x);
        REQUIRE(r.status == zerofpr::status_t::non_finite_value);
    }
}

namespace {
/// ℓ₁ prox which breaks down on its `nan_at`-th call.
struct failing_prox_t {
    zerofpr::norm_l1_fn g;
    unsigned            nan_at;
    unsigned            calls;

    auto operator()(gsl::span<double const> v, double const gamma,
                    gsl::span<double> out) -> double
    {
        auto const value = g(v, gamma, out);
        if (++calls == nan_at) {
            out[0] = std::numeric_limits<double>::quiet_NaN();
        }
        return value;
    }
};

/// Remembers what the stopping criterion saw last.
struct last_seen_t {
    std::vector<double> xbar;
    double              normfpr;
    double              cost;
    unsigned            calls;

    auto operator()(zerofpr::zerofpr_state_t const& state, double, double,
                    double) -> bool
    {
        xbar.assign(state.xbar.begin(), state.xbar.end());
        normfpr = state.normfpr;
        cost    = state.cost;
        ++calls;
        return false;
    }
};
} // namespace

TEST_CASE("Failure mid-run keeps the last accepted point", "[zerofpr]")
{
    zerofpr::affine_t const A{
        zerofpr::dense_matrix_t{2, 2, {3.0, 1.0, 1.0, 2.0}},
        std::vector<double>{1.0, -1.0}};
    auto params = quiet_params();
    auto prox   = failing_prox_t{zerofpr::norm_l1_fn{0.1}, 6, 0};
    auto seen   = last_seen_t{{}, 0.0, 0.0, 0};

    SECTION("with a fixed step size")
    {
        // L ≈ 13.09
        params.gamma       = 0.07;
        params.line_search = false;
        std::vector<double> x = {1.0, 1.0};
        auto const          r = zerofpr::minimize(A, prox, params, x, seen);
        REQUIRE(r.status == zerofpr::status_t::non_finite_value);
        REQUIRE(seen.calls > 0);
        REQUIRE(x == seen.xbar);
        REQUIRE(std::isfinite(r.normfpr));
        REQUIRE(r.normfpr == seen.normfpr);
        REQUIRE(r.cost == seen.cost);
        REQUIRE(r.gamma == 0.07);
        REQUIRE(prox.calls <= prox.nan_at + 1);
    }
    SECTION("with γ search")
    {
        std::vector<double> x = {1.0, 1.0};
        auto const          r = zerofpr::minimize(A, prox, params, x, seen);
        REQUIRE(r.status == zerofpr::status_t::non_finite_value);
        REQUIRE(std::all_of(x.begin(), x.end(),
                            [](auto const v) { return std::isfinite(v); }));
        REQUIRE(std::isfinite(r.normfpr));
        REQUIRE(std::isfinite(r.cost));
        REQUIRE(std::isfinite(r.gamma));
        REQUIRE(prox.calls <= prox.nan_at + 1);
    }
}

TEST_CASE("Exceptions from the stopping criterion propagate", "[zerofpr]")
{
    auto const          A = zerofpr::dense_matrix_t::identity(3);
    std::vector<double> x = {1.0, 2.0, 3.0};
    auto const halt = [](zerofpr::zerofpr_state_t const& state, double, double,
                         double) -> bool {
        if (state.iteration == 2) { throw std::runtime_error{"stop"}; }
        return false;
    };
    REQUIRE_THROWS_AS(
        zerofpr::minimize(A, zerofpr::zero_fn{}, quiet_params(), x, halt),
        std::runtime_error);
    REQUIRE(x == std::vector<double>{1.0, 2.0, 3.0});
}

TEST_CASE("Stopping criterion signature is checked", "[zerofpr]")
{
    auto const good = [](zerofpr::zerofpr_state_t const&, double, double,
                         double) { return true; };
    auto const bad  = [](zerofpr::zerofpr_state_t const&, double, double,
                        double) { return std::string{}; };
    static_assert(zerofpr::detail::is_halt_v<decltype(good)>);
    static_assert(!zerofpr::detail::is_halt_v<decltype(bad)>);
    static_assert(zerofpr::detail::is_halt_v<zerofpr::normfpr_small_enough_fn>);
    static_assert(zerofpr::detail::is_prox_v<zerofpr::norm_l1_fn const>);
}

TEST_CASE("Buffers can be reused", "[zerofpr]")
{
    zerofpr::zerofpr_buffers_t buffers;
    auto const                 params = quiet_params();
    auto const                 halt   = zerofpr::normfpr_small_enough_fn{1e-10};

    zerofpr::affine_t const A{zerofpr::dense_matrix_t::identity(2),
                              std::vector<double>{3.0, 0.0}};
    std::vector<double>     x = {0.0, 0.0};
    auto r = zerofpr::minimize(A, zerofpr::norm_l1_fn{1.0}, params, x, halt,
                               buffers);
    REQUIRE(r.status == zerofpr::status_t::success);
    REQUIRE(x[0] == Approx(2.0));

    zerofpr::affine_t const B{random_matrix(8, 4, 3), random_vector(8, 4)};
    std::vector<double>     y(4, 0.0);
    std::vector<double>     z(4, 0.0);
    r = zerofpr::minimize(B, zerofpr::norm_l1_fn{0.3}, params, y, halt,
                          buffers);
    REQUIRE(r.status == zerofpr::status_t::success);
    r = zerofpr::minimize(B, zerofpr::norm_l1_fn{0.3}, params, z, halt);
    REQUIRE(r.status == zerofpr::status_t::success);
    // Same problem, same answer
    for (auto i = size_t{0}; i < y.size(); ++i) {
        REQUIRE(y[i] == Approx(z[i]));
    }
}

namespace {
auto count_lines(std::FILE* file) -> unsigned
{
    std::rewind(file);
    auto count = 0U;
    for (auto c = std::fgetc(file); c != EOF; c = std::fgetc(file)) {
        if (c == '\n') { ++count; }
    }
    return count;
}
} // namespace

TEST_CASE("Progress is reported at the requested cadence", "[zerofpr]")
{
    zerofpr::affine_t const A{random_matrix(10, 4, 17), random_vector(10, 18)};
    auto const never = [](zerofpr::zerofpr_state_t const&, double, double,
                          double) { return false; };
    auto* file = std::tmpfile();
    REQUIRE(file != nullptr);

    auto params          = quiet_params();
    params.max_iter      = 7;
    params.report_every  = 3;
    params.report_stream = file;
    auto const lines     = [&](zerofpr::verbosity_t const verbose) {
        params.verbose = verbose;
        std::vector<double> x(4, 1.0);
        auto const          r =
            zerofpr::minimize(A, zerofpr::norm_l1_fn{0.1}, params, x, never);
        REQUIRE(r.status == zerofpr::status_t::too_many_iterations);
        std::fflush(file);
        auto const n = count_lines(file);
        std::fclose(file);
        file                 = std::tmpfile();
        params.report_stream = file;
        return n;
    };

    REQUIRE(lines(zerofpr::verbosity_t::off) == 0);
    // Header, iterations 1, 3 and 6, and the final state
    REQUIRE(lines(zerofpr::verbosity_t::periodic) == 5);
    // Header, iterations 1 to 7, and the final state
    REQUIRE(lines(zerofpr::verbosity_t::every_iteration) == 9);

    params.max_iter = 0;
    // Header and the initial state
    REQUIRE(lines(zerofpr::verbosity_t::every_iteration) == 2);
    REQUIRE(lines(zerofpr::verbosity_t::periodic) == 2);
    std::fclose(file);
}

TEST_CASE("Error codes and summaries", "[zerofpr]")
{
    std::error_code const ec = zerofpr::status_t::dimension_mismatch;
    REQUIRE(ec);
    REQUIRE(std::string{ec.category().name()} == "zerofpr category");
    REQUIRE_FALSE(std::error_code{zerofpr::status_t::success});

    auto const          A = zerofpr::dense_matrix_t::identity(2);
    std::vector<double> x = {1.0, 1.0};
    auto const r = zerofpr::minimize(A, zerofpr::zero_fn{}, quiet_params(), x);

    auto* file = std::tmpfile();
    REQUIRE(file != nullptr);
    zerofpr::print_summary(file, r);
    std::rewind(file);
    char buffer[64] = {};
    REQUIRE(std::fgets(buffer, sizeof(buffer), file) != nullptr);
    std::fclose(file);
    REQUIRE(std::string{buffer} == "status: no error\n");
}
