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

#include "zerofpr/prox.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

ZEROFPR_NAMESPACE_BEGIN

namespace {
auto check_lambda(double const lambda, char const* who) -> double
{
    if (!(lambda >= 0.0) || std::isinf(lambda)) {
        throw std::invalid_argument{std::string{who}
                                    + ": λ must be a non-negative number, but "
                                      "got "
                                    + std::to_string(lambda)};
    }
    return lambda;
}
} // namespace

ZEROFPR_EXPORT auto zero_fn::operator()(gsl::span<double const> v,
                                        double /*gamma*/,
                                        gsl::span<double> out) const noexcept
    -> double
{
    ZEROFPR_ASSERT(v.size() == out.size(), "incompatible dimensions");
    if (v.data() != out.data()) { std::copy(v.begin(), v.end(), out.begin()); }
    return 0.0;
}

ZEROFPR_EXPORT norm_l1_fn::norm_l1_fn(double const _lambda)
    : lambda{check_lambda(_lambda, "norm_l1_fn")}
{}

ZEROFPR_EXPORT auto norm_l1_fn::operator()(gsl::span<double const> v,
                                           double const gamma,
                                           gsl::span<double> out) const noexcept
    -> double
{
    ZEROFPR_ASSERT(v.size() == out.size(), "incompatible dimensions");
    auto const threshold = lambda * gamma;
    auto       norm      = 0.0;
    for (auto i = size_t{0}; i < v.size(); ++i) {
        auto const x = v[i];
        auto const y = std::copysign(std::max(std::abs(x) - threshold, 0.0), x);
        out[i]       = y;
        norm += std::abs(y);
    }
    return lambda * norm;
}

ZEROFPR_EXPORT norm_l0_fn::norm_l0_fn(double const _lambda)
    : lambda{check_lambda(_lambda, "norm_l0_fn")}
{}

ZEROFPR_EXPORT auto norm_l0_fn::operator()(gsl::span<double const> v,
                                           double const gamma,
                                           gsl::span<double> out) const noexcept
    -> double
{
    ZEROFPR_ASSERT(v.size() == out.size(), "incompatible dimensions");
    // |x| > √(2λγ)  ⇔  x² > 2λγ
    auto const threshold = 2.0 * lambda * gamma;
    auto       count     = size_t{0};
    for (auto i = size_t{0}; i < v.size(); ++i) {
        auto const x = v[i];
        if (x * x > threshold) {
            out[i] = x;
            ++count;
        }
        else {
            out[i] = 0.0;
        }
    }
    return lambda * static_cast<double>(count);
}

ZEROFPR_EXPORT sqr_norm_l2_fn::sqr_norm_l2_fn(double const _lambda)
    : lambda{check_lambda(_lambda, "sqr_norm_l2_fn")}
{}

ZEROFPR_EXPORT auto
sqr_norm_l2_fn::operator()(gsl::span<double const> v, double const gamma,
                           gsl::span<double> out) const noexcept -> double
{
    ZEROFPR_ASSERT(v.size() == out.size(), "incompatible dimensions");
    auto const scale = 1.0 / (1.0 + lambda * gamma);
    auto       norm  = 0.0;
    for (auto i = size_t{0}; i < v.size(); ++i) {
        auto const y = scale * v[i];
        out[i]       = y;
        norm += y * y;
    }
    return 0.5 * lambda * norm;
}

ZEROFPR_EXPORT auto
indicator_nonneg_fn::operator()(gsl::span<double const> v, double /*gamma*/,
                                gsl::span<double> out) const noexcept -> double
{
    ZEROFPR_ASSERT(v.size() == out.size(), "incompatible dimensions");
    std::transform(v.begin(), v.end(), out.begin(),
                   [](auto const x) { return std::max(x, 0.0); });
    return 0.0;
}

ZEROFPR_EXPORT indicator_box_fn::indicator_box_fn(double const _lo,
                                                  double const _hi)
    : lo{_lo}, hi{_hi}
{
    if (!(lo <= hi)) {
        throw std::invalid_argument{
            "indicator_box_fn: invalid box [" + std::to_string(lo) + ", "
            + std::to_string(hi) + "]"};
    }
}

ZEROFPR_EXPORT auto
indicator_box_fn::operator()(gsl::span<double const> v, double /*gamma*/,
                             gsl::span<double> out) const noexcept -> double
{
    ZEROFPR_ASSERT(v.size() == out.size(), "incompatible dimensions");
    std::transform(v.begin(), v.end(), out.begin(), [this](auto const x) {
        return std::min(std::max(x, lo), hi);
    });
    return 0.0;
}

ZEROFPR_NAMESPACE_END
