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

#include "zerofpr/operator.hpp"
#include <cblas.h>

#include <algorithm>
#include <limits>
#include <string>

ZEROFPR_NAMESPACE_BEGIN

namespace {
template <class T> struct get_blas_int_type;

template <class T>
struct get_blas_int_type<double (*)(T, double const*, T, double const*, T)> {
    using type = T;
};

using blas_int = typename get_blas_int_type<decltype(&cblas_ddot)>::type;

auto check_dimensions(size_t const rows, size_t const cols,
                      size_t const size) -> void
{
    constexpr auto max = static_cast<size_t>(std::numeric_limits<blas_int>::max());
    if (rows > max || cols > max) {
        throw std::invalid_argument{
            "dense_matrix_t: dimensions do not fit into a BLAS integer"};
    }
    if (cols != 0 && rows > std::numeric_limits<size_t>::max() / cols) {
        throw std::invalid_argument{"dense_matrix_t: integer overflow"};
    }
    if (rows * cols != size) {
        throw std::invalid_argument{
            "dense_matrix_t: expected " + std::to_string(rows * cols)
            + " elements, but got " + std::to_string(size)};
    }
}
} // namespace

ZEROFPR_EXPORT dense_matrix_t::dense_matrix_t(size_t const rows,
                                              size_t const cols,
                                              std::vector<double> data)
    : _rows{rows}, _cols{cols}, _data{std::move(data)}
{
    check_dimensions(_rows, _cols, _data.size());
}

ZEROFPR_EXPORT auto dense_matrix_t::identity(size_t const n) -> dense_matrix_t
{
    auto m = zeros(n, n);
    for (auto i = size_t{0}; i < n; ++i) {
        m._data[i * n + i] = 1.0;
    }
    return m;
}

ZEROFPR_EXPORT auto dense_matrix_t::zeros(size_t const rows, size_t const cols)
    -> dense_matrix_t
{
    check_dimensions(rows, cols, rows * cols);
    return dense_matrix_t{rows, cols, std::vector<double>(rows * cols, 0.0)};
}

ZEROFPR_EXPORT auto dense_matrix_t::apply(gsl::span<double const> x,
                                          gsl::span<double> y) const noexcept
    -> void
{
    ZEROFPR_ASSERT(x.size() == _cols && y.size() == _rows,
                   "incompatible dimensions");
    if (_rows == 0) { return; }
    if (_cols == 0) {
        std::fill(y.begin(), y.end(), 0.0);
        return;
    }
    cblas_dgemv(CblasRowMajor, CblasNoTrans, static_cast<blas_int>(_rows),
                static_cast<blas_int>(_cols), 1.0, _data.data(),
                static_cast<blas_int>(_cols), x.data(), 1, 0.0, y.data(), 1);
}

ZEROFPR_EXPORT auto dense_matrix_t::apply_adjoint(gsl::span<double const> y,
                                                  gsl::span<double> x) const
    noexcept -> void
{
    ZEROFPR_ASSERT(x.size() == _cols && y.size() == _rows,
                   "incompatible dimensions");
    if (_cols == 0) { return; }
    if (_rows == 0) {
        std::fill(x.begin(), x.end(), 0.0);
        return;
    }
    cblas_dgemv(CblasRowMajor, CblasTrans, static_cast<blas_int>(_rows),
                static_cast<blas_int>(_cols), 1.0, _data.data(),
                static_cast<blas_int>(_cols), y.data(), 1, 0.0, x.data(), 1);
}

ZEROFPR_NAMESPACE_END
