#pragma once

#include "zerofpr/operator.hpp"

#include <gsl/gsl-lite.hpp>

#include <vector>

/// A random lasso problem `minimize ½‖A·x - b‖² + λ‖x‖₁`.
struct lasso_problem_t {
    ::ZEROFPR_NAMESPACE::affine_t<::ZEROFPR_NAMESPACE::dense_matrix_t> op;
    double                                                             lambda;
};

/// \brief Generates a lasso problem with a sparse ground truth.
///
/// `A` has i.i.d. normal entries scaled by `1/√rows`, `b = A·x_true + noise`
/// where `x_true` has `density·cols` nonzeros, and `λ = 0.1·‖Aᵗ·b‖∞`.
auto make_lasso(size_t rows, size_t cols, double density, unsigned seed)
    -> lasso_problem_t;

/// `‖x‖∞`
auto max_abs(gsl::span<double const> x) noexcept -> double;
