#include "core.hpp"

#include <algorithm>
#include <cmath>
#include <random>

auto max_abs(gsl::span<double const> x) noexcept -> double
{
    auto r = 0.0;
    for (auto const v : x) {
        r = std::max(r, std::abs(v));
    }
    return r;
}

auto make_lasso(size_t const rows, size_t const cols, double const density,
                unsigned const seed) -> lasso_problem_t
{
    std::mt19937                     gen{seed};
    std::normal_distribution<double> normal;

    auto const          scale = 1.0 / std::sqrt(static_cast<double>(rows));
    std::vector<double> data(rows * cols);
    std::generate(data.begin(), data.end(),
                  [&]() { return scale * normal(gen); });
    ::ZEROFPR_NAMESPACE::dense_matrix_t A{rows, cols, std::move(data)};

    std::vector<double>            x_true(cols, 0.0);
    std::bernoulli_distribution    nonzero{density};
    for (auto& x : x_true) {
        if (nonzero(gen)) { x = normal(gen); }
    }
    std::vector<double> b(rows);
    A.apply(x_true, b);
    for (auto& y : b) {
        y += 0.01 * normal(gen);
    }

    std::vector<double> ATb(cols);
    A.apply_adjoint(b, ATb);
    auto const lambda = 0.1 * max_abs(ATb);
    return {::ZEROFPR_NAMESPACE::affine_t{std::move(A), std::move(b)}, lambda};
}
