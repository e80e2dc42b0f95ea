// Copyright (c) 2019, Tom Westerhout
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

#include "config.hpp"

#include <gsl/gsl-lite.hpp>

/// \file prox.hpp
///
/// Proximal operators of some common regularisers.
///
/// A proximal operator is any callable with the signature
///
///     auto (gsl::span<double const> v, double gamma, gsl::span<double> out)
///         -> double
///
/// which stores `prox_{γg}(v) = argmin_x g(x) + 1/(2γ)·‖x - v‖²` into `out` and
/// returns `g(out)`. `v` and `out` are allowed to alias.

ZEROFPR_NAMESPACE_BEGIN

/// `g(x) = 0`
struct zero_fn {
    auto operator()(gsl::span<double const> v, double gamma,
                    gsl::span<double> out) const noexcept -> double;
};

/// `g(x) = λ‖x‖₁`. The proximal operator is soft thresholding at `λγ`.
struct norm_l1_fn {
    /// \throws std::invalid_argument if `lambda < 0`.
    explicit norm_l1_fn(double lambda);

    auto operator()(gsl::span<double const> v, double gamma,
                    gsl::span<double> out) const noexcept -> double;

    double lambda;
};

/// `g(x) = λ·nnz(x)`. Nonconvex; the proximal operator is hard thresholding at
/// `√(2λγ)`.
struct norm_l0_fn {
    /// \throws std::invalid_argument if `lambda < 0`.
    explicit norm_l0_fn(double lambda);

    auto operator()(gsl::span<double const> v, double gamma,
                    gsl::span<double> out) const noexcept -> double;

    double lambda;
};

/// `g(x) = λ/2·‖x‖²`
struct sqr_norm_l2_fn {
    /// \throws std::invalid_argument if `lambda < 0`.
    explicit sqr_norm_l2_fn(double lambda);

    auto operator()(gsl::span<double const> v, double gamma,
                    gsl::span<double> out) const noexcept -> double;

    double lambda;
};

/// Indicator of the nonnegative orthant `{x : x ≥ 0}`.
struct indicator_nonneg_fn {
    auto operator()(gsl::span<double const> v, double gamma,
                    gsl::span<double> out) const noexcept -> double;
};

/// Indicator of the box `{x : lo ≤ x ≤ hi}`.
struct indicator_box_fn {
    /// \throws std::invalid_argument if `lo > hi` or either bound is NaN.
    indicator_box_fn(double lo, double hi);

    auto operator()(gsl::span<double const> v, double gamma,
                    gsl::span<double> out) const noexcept -> double;

    double lo;
    double hi;
};

ZEROFPR_NAMESPACE_END
