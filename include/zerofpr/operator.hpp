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

#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

/// \file operator.hpp
///
/// Linear operators consumed by the solver. An operator type `Op` has to
/// provide
///
///   * `rows()` and `cols()`: dimensions of the codomain and domain;
///   * `apply(x, y)`: `y ← A·x`;
///   * `apply_adjoint(y, x)`: `x ← Aᵗ·y` (of the linear part);
///   * `static constexpr operator_kind_t kind`.
///
/// Affine operators additionally provide `linear()` returning their linear
/// part.

ZEROFPR_NAMESPACE_BEGIN

enum class operator_kind_t { linear, affine };

/// \brief Dense row-major matrix.
class dense_matrix_t {
  public:
    static constexpr auto kind = operator_kind_t::linear;

    /// \throws std::invalid_argument if `data.size() != rows * cols`.
    dense_matrix_t(size_t rows, size_t cols, std::vector<double> data);

    /// Creates an `n×n` identity matrix.
    static auto identity(size_t n) -> dense_matrix_t;
    /// Creates an `rows×cols` matrix of zeros.
    static auto zeros(size_t rows, size_t cols) -> dense_matrix_t;

    [[nodiscard]] auto rows() const noexcept -> size_t { return _rows; }
    [[nodiscard]] auto cols() const noexcept -> size_t { return _cols; }
    [[nodiscard]] auto data() const noexcept -> gsl::span<double const>
    {
        return _data;
    }

    auto apply(gsl::span<double const> x, gsl::span<double> y) const noexcept
        -> void;
    auto apply_adjoint(gsl::span<double const> y,
                       gsl::span<double> x) const noexcept -> void;

  private:
    size_t              _rows;
    size_t              _cols;
    std::vector<double> _data;
};

/// \brief Affine map `x ↦ A·x - b`.
///
/// Using it inside the smooth term gives the usual least squares cost
/// `½‖A·x - b‖²`.
template <class Linear> class affine_t {
    static_assert(Linear::kind == operator_kind_t::linear,
                  "affine_t expects a linear operator");

  public:
    static constexpr auto kind = operator_kind_t::affine;

    /// \throws std::invalid_argument if `b.size() != A.rows()`.
    affine_t(Linear A, std::vector<double> b)
        : _linear{std::move(A)}, _offset{std::move(b)}
    {
        if (_offset.size() != _linear.rows()) {
            throw std::invalid_argument{
                "affine_t: size of b does not match the number of rows of A"};
        }
    }

    [[nodiscard]] auto rows() const noexcept -> size_t
    {
        return _linear.rows();
    }
    [[nodiscard]] auto cols() const noexcept -> size_t
    {
        return _linear.cols();
    }
    [[nodiscard]] auto linear() const noexcept -> Linear const&
    {
        return _linear;
    }
    [[nodiscard]] auto offset() const noexcept -> gsl::span<double const>
    {
        return _offset;
    }

    auto apply(gsl::span<double const> x, gsl::span<double> y) const -> void
    {
        _linear.apply(x, y);
        for (auto i = size_t{0}; i < y.size(); ++i) {
            y[i] -= _offset[i];
        }
    }

    auto apply_adjoint(gsl::span<double const> y, gsl::span<double> x) const
        -> void
    {
        _linear.apply_adjoint(y, x);
    }

  private:
    Linear              _linear;
    std::vector<double> _offset;
};

template <class Linear>
affine_t(Linear, std::vector<double>)->affine_t<Linear>;

namespace detail {
/// Computes `y ← A·x` where `A` is the linear part of \p op.
///
/// For a linear operator this is just `op.apply`. For an affine one the offset
/// must not enter the product, because we use it for directions.
template <class Operator>
auto apply_linear_part(Operator const& op, gsl::span<double const> x,
                       gsl::span<double> y) -> void
{
    if constexpr (std::decay_t<Operator>::kind == operator_kind_t::linear) {
        op.apply(x, y);
    }
    else {
        static_assert(std::decay_t<Operator>::kind == operator_kind_t::affine,
                      "unknown operator kind");
        op.linear().apply(x, y);
    }
}
} // namespace detail

ZEROFPR_NAMESPACE_END
