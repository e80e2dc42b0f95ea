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

// vim: foldenable foldmethod=marker
#include "zerofpr/zerofpr.hpp"
#include <cblas.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>

ZEROFPR_NAMESPACE_BEGIN

// ============================= Error codes =============================== {{{
namespace { // anonymous namespace
struct zerofpr_error_category : public std::error_category {
    constexpr zerofpr_error_category() noexcept = default;

    zerofpr_error_category(zerofpr_error_category const&) = delete;
    zerofpr_error_category(zerofpr_error_category&&)      = delete;
    auto operator                  =(zerofpr_error_category const&)
        -> zerofpr_error_category& = delete;
    auto operator=(zerofpr_error_category &&) -> zerofpr_error_category& = delete;

    ~zerofpr_error_category() override = default;

    [[nodiscard]] auto        name() const noexcept -> char const* override;
    [[nodiscard]] auto        message(int value) const -> std::string override;
    [[nodiscard]] static auto instance() noexcept -> std::error_category const&;
};

auto zerofpr_error_category::name() const noexcept -> char const*
{
    return "zerofpr category";
}

auto zerofpr_error_category::message(int const value) const -> std::string
{
    switch (static_cast<status_t>(value)) {
    case status_t::success: return "no error";
    case status_t::too_many_iterations: return "too many iterations";
    case status_t::out_of_memory: return "out of memory";
    case status_t::invalid_tolerance: return "invalid tolerance";
    case status_t::invalid_step_size: return "invalid step size γ";
    case status_t::invalid_beta: return "invalid parameter β";
    case status_t::invalid_trial_budget:
        return "line search trial budget must be positive";
    case status_t::invalid_shrink_factor: return "invalid τ shrink factor";
    case status_t::invalid_report_interval: return "invalid report interval";
    case status_t::invalid_argument: return "received an invalid argument";
    case status_t::dimension_mismatch:
        return "dimensions of the operator and the initial point differ";
    case status_t::non_finite_value:
        return "encountered a non-finite value";
#if defined(ZEROFPR_CLANG)
#    pragma clang diagnostic push
#    pragma clang diagnostic ignored "-Wcovered-switch-default"
#endif
    // NOTE: The user could have constructed an invalid error code using our
    // category
    // NOLINTNEXTLINE
    default: return "(unrecognised error)";
#if defined(ZEROFPR_CLANG)
#    pragma clang diagnostic pop
#endif
    } // end switch
}

auto zerofpr_error_category::instance() noexcept -> std::error_category const&
{
#if defined(ZEROFPR_CLANG)
#    pragma clang diagnostic push
#    pragma clang diagnostic ignored "-Wexit-time-destructors"
#endif
    static zerofpr_error_category c; // NOLINT
#if defined(ZEROFPR_CLANG)
#    pragma clang diagnostic pop
#endif
    return c;
}
} // namespace

ZEROFPR_EXPORT auto make_error_code(status_t const e) noexcept
    -> std::error_code
{
    return {static_cast<int>(e), zerofpr_error_category::instance()};
}
// ============================= Error codes =============================== }}}

namespace detail {
[[noreturn]] ZEROFPR_EXPORT auto assert_fail(char const* expr,
                                             char const* file,
                                             unsigned const line,
                                             char const* function,
                                             char const* msg) noexcept -> void
{
    // NOLINTNEXTLINE
    std::fprintf(stderr,
                 ZEROFPR_BUG_MESSAGE
                 "\n\x1b[1m\x1b[91mAssertion failed\x1b[0m at %s:%u: %s: "
                 "\"\x1b[1m\x1b[97m%s\x1b[0m\" evaluated to false: "
                 "\x1b[1m\x1b[97m%s\x1b[0m\n",
                 file, line, function, expr, msg);
    std::terminate();
}

// ================================= BLAS ================================== {{{
// We pattern match on the signature of `cblas_ddot` to find out which integral
// type BLAS uses for sizes and increments.
template <class T> struct get_blas_int_type;

template <class T>
struct get_blas_int_type<double (*)(T, double const*, T, double const*, T)> {
    using type = T;
};

using blas_int = typename get_blas_int_type<decltype(&cblas_ddot)>::type;

namespace {
inline auto to_blas_int(size_t const n) noexcept -> blas_int
{
    ZEROFPR_ASSERT(
        n <= static_cast<size_t>(std::numeric_limits<blas_int>::max()),
        "integer overflow");
    return static_cast<blas_int>(n);
}
} // namespace

ZEROFPR_EXPORT auto dot(gsl::span<double const> a,
                        gsl::span<double const> b) noexcept -> double
{
    ZEROFPR_ASSERT(a.size() == b.size(), "incompatible dimensions");
    return cblas_ddot(to_blas_int(a.size()), a.data(), 1, b.data(), 1);
}

ZEROFPR_EXPORT auto nrm2(gsl::span<double const> x) noexcept -> double
{
    return cblas_dnrm2(to_blas_int(x.size()), x.data(), 1);
}

ZEROFPR_EXPORT auto scal(double const a, gsl::span<double> x) noexcept -> void
{
    cblas_dscal(to_blas_int(x.size()), a, x.data(), 1);
}

ZEROFPR_EXPORT auto copy(gsl::span<double const> src,
                         gsl::span<double> dst) noexcept -> void
{
    ZEROFPR_ASSERT(src.size() == dst.size(), "incompatible dimensions");
    cblas_dcopy(to_blas_int(src.size()), src.data(), 1, dst.data(), 1);
}

ZEROFPR_EXPORT auto negative_copy(gsl::span<double const> const src,
                                  gsl::span<double> const dst) noexcept -> void
{
    ZEROFPR_ASSERT(src.size() == dst.size(), "incompatible dimensions");
    for (auto i = size_t{0}; i < src.size(); ++i) {
        dst[i] = -src[i];
    }
}

ZEROFPR_EXPORT auto subtract(gsl::span<double const> x,
                             gsl::span<double const> y,
                             gsl::span<double> out) noexcept -> void
{
    ZEROFPR_ASSERT(x.size() == y.size() && y.size() == out.size(),
                   "incompatible dimensions");
    for (auto i = size_t{0}; i < x.size(); ++i) {
        out[i] = x[i] - y[i];
    }
}

ZEROFPR_EXPORT auto axpy(double const a, gsl::span<double const> x,
                         gsl::span<double> y) noexcept -> void
{
    ZEROFPR_ASSERT(x.size() == y.size(), "incompatible dimensions");
    cblas_daxpy(to_blas_int(x.size()), a, x.data(), 1, y.data(), 1);
}

ZEROFPR_EXPORT auto axpy(double const a, gsl::span<double const> x,
                         gsl::span<double const> y,
                         gsl::span<double> out) noexcept -> void
{
    ZEROFPR_ASSERT(x.size() == y.size() && y.size() == out.size(),
                   "incompatible dimensions");
    ZEROFPR_ASSERT(x.data() != out.data(), "`x` and `out` may not overlap");
    copy(y, out);
    axpy(a, x, out);
}
// ================================= BLAS ================================== }}}

// =============================== Envelope ================================ {{{
ZEROFPR_EXPORT auto
evaluate_envelope(double const f_x, gsl::span<double const> grad_x,
                  gsl::span<double const> x, gsl::span<double const> xbar,
                  double const g_xbar, double const gamma,
                  gsl::span<double> r) noexcept -> envelope_t
{
    ZEROFPR_ASSERT(gamma > 0.0, "invalid γ");
    subtract(x, xbar, r);
    auto const sqr_normfpr = dot(as_const(r), as_const(r));
    auto const uppbnd =
        f_x - dot(grad_x, as_const(r)) + sqr_normfpr / (2.0 * gamma);
    return {std::sqrt(sqr_normfpr), uppbnd, uppbnd + g_xbar};
}
// =============================== Envelope ================================ }}}

namespace {
template <size_t Alignment>
constexpr auto align_up(size_t const value) noexcept -> size_t
{
    static_assert(Alignment != 0 && (Alignment & (Alignment - 1)) == 0,
                  "Invalid alignment");
    return (value + (Alignment - 1)) & ~(Alignment - 1);
}
} // namespace
} // namespace detail

// =============================== Buffers ================================= {{{
struct zerofpr_buffers_t::impl_t {
    static constexpr auto cache_line_size = 64UL;

    struct Deleter {
        template <class T> auto operator()(T* p) const noexcept
        {
            // NOLINTNEXTLINE(cppcoreguidelines-owning-memory, cppcoreguidelines-no-malloc, hicpp-no-malloc)
            std::free(p);
        }
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays, hicpp-avoid-c-arrays, modernize-avoid-c-arrays)
    std::unique_ptr<double[], Deleter>    _workspace;
    std::vector<detail::iteration_data_t> _history;
    size_t                                _n;
    size_t                                _rows;

  public:
    impl_t() noexcept : _workspace{}, _history{}, _n{0}, _rows{0} {}
    impl_t(size_t const n, size_t const rows, size_t const m)
        : _workspace{}, _history{}, _n{0}, _rows{0}
    {
        resize(n, rows, m);
    }

    impl_t(const impl_t&)     = delete;
    impl_t(impl_t&&) noexcept = default;
    auto operator=(const impl_t&) -> impl_t& = delete;
    auto operator=(impl_t&&) noexcept -> impl_t& = default;
    ~impl_t() noexcept                           = default;

    auto resize(size_t const n, size_t const rows, size_t const m) -> void
    {
        if (n == _n && rows == _rows && m == _history.size()
            && _workspace != nullptr) {
            return;
        }
        // _workspace is re-allocated, so we don't want to keep dangling
        // pointers around
        _history.clear();
        _workspace.reset(nullptr); // release memory before allocating more
        _n    = 0;
        _rows = 0;

        _history.resize(
            m, {0.0, std::numeric_limits<double>::quiet_NaN(), {}, {}});
        // Every buffer starts at a cache line boundary and its size is a
        // multiple of cache lines.
        auto const size = total_size(n, rows, m);
        _workspace      = allocate_buffer(size);
        std::memset(_workspace.get(), 0, size * sizeof(double));
        _n    = n;
        _rows = rows;
        for (auto i = size_t{0}; i < _history.size(); ++i) {
            _history[i].s = get(2 * i);
            _history[i].y = get(2 * i + 1);
        }
    }

    auto make_state() noexcept -> zerofpr_state_t
    {
        constexpr auto NaN = std::numeric_limits<double>::quiet_NaN();
        auto const     m   = _history.size();
        return zerofpr_state_t{
            get(2 * m + 0),  // x
            get(2 * m + 1),  // xbar
            get(2 * m + 2),  // xbar_prev
            get(2 * m + 3),  // r
            get(2 * m + 4),  // rbar
            get(2 * m + 5),  // rbar_prev
            get(2 * m + 6),  // grad_x
            get(2 * m + 7),  // grad_xbar
            get(2 * m + 8),  // grad_step
            get(2 * m + 9),  // xbarbar
            get(2 * m + 10), // d
            get(2 * m + 11), // ATAd
            get_rows(0),     // res_x
            get_rows(1),     // res_xbar
            get_rows(2),     // Ad
            detail::lbfgs_history_t{{_history}},
            NaN, // f_x
            NaN, // f_xbar
            NaN, // g_xbar
            NaN, // uppbnd
            NaN, // fbe
            NaN, // fbe_prev
            NaN, // fbe_trial
            NaN, // normfpr
            NaN, // normfpr_0
            NaN, // cost
            NaN, // gamma
            NaN, // sigma
            NaN, // tau
            NaN, // level
            0.0, // time
            0,
            0,
            0,
            0,
            0};
    }

  private:
    static auto allocate_buffer(size_t size)
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays, hicpp-avoid-c-arrays, modernize-avoid-c-arrays)
        -> std::unique_ptr<double[], Deleter>
    {
        if (size > std::numeric_limits<size_t>::max() / sizeof(double)) {
            throw std::overflow_error{
                "integer overflow in impl_t::allocate_buffer(size_t)"};
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast, cppcoreguidelines-owning-memory)
        auto* p = reinterpret_cast<double*>(
            std::aligned_alloc(cache_line_size, size * sizeof(double)));
        if (p == nullptr) { throw std::bad_alloc{}; }
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays, hicpp-avoid-c-arrays, modernize-avoid-c-arrays)
        return std::unique_ptr<double[], Deleter>{p};
    }

    static constexpr auto vector_size(size_t const n) noexcept -> size_t
    {
        return detail::align_up<cache_line_size / sizeof(double)>(n);
    }

    static constexpr auto number_vectors(size_t const m) noexcept -> size_t
    {
        return 2 * m /* s and y vectors of the last m iterations */
               + 12; /* x, x̄, x̄_prev, r, r̄, r̄_prev, ∇f(x), ∇f(x̄),
                        x - γ∇f(x), x̄̄, d, AᵗAd */
    }

    static constexpr auto number_row_vectors() noexcept -> size_t
    {
        return 3; /* Ax, Ax̄, Ad */
    }

    static auto total_size(size_t const n, size_t const rows, size_t const m)
        -> size_t
    {
        constexpr auto max = std::numeric_limits<size_t>::max();
        auto const     a   = vector_size(n);
        auto const     b   = vector_size(rows);
        if (n > max / 2 || rows > max / 2 || m > max / 4
            || (a != 0 && number_vectors(m) > max / a)
            || (b != 0 && number_row_vectors() > max / b)
            || a * number_vectors(m) > max - b * number_row_vectors()) {
            throw std::overflow_error{
                "integer overflow in impl_t::total_size(size_t, size_t, "
                "size_t)"};
        }
        // aligned_alloc doesn't like zero sizes
        return std::max(a * number_vectors(m) + b * number_row_vectors(),
                        size_t{cache_line_size / sizeof(double)});
    }

    auto get(size_t const i) noexcept -> gsl::span<double>
    {
        auto const size = vector_size(_n);
        ZEROFPR_ASSERT(i < number_vectors(_history.size()),
                       "index out of bounds");
        auto* p = _workspace.get() + i * size;
        ZEROFPR_ASSERT(
            reinterpret_cast<std::uintptr_t>(p) % cache_line_size == 0,
            "buffer is not aligned to cache line boundary");
        return {p, _n};
    }

    auto get_rows(size_t const i) noexcept -> gsl::span<double>
    {
        ZEROFPR_ASSERT(i < number_row_vectors(), "index out of bounds");
        auto* p = _workspace.get()
                  + vector_size(_n) * number_vectors(_history.size())
                  + i * vector_size(_rows);
        return {p, _rows};
    }
};

auto zerofpr_buffers_t::impl() noexcept -> impl_t&
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return *reinterpret_cast<impl_t*>(&_storage);
}

// NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init, hicpp-member-init)
ZEROFPR_EXPORT zerofpr_buffers_t::zerofpr_buffers_t() noexcept
{
    static_assert(sizeof(impl_t) <= sizeof(storage_type));
    static_assert(alignof(impl_t) <= alignof(storage_type));
    new (&_storage) impl_t{};
}

// NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init, hicpp-member-init)
ZEROFPR_EXPORT zerofpr_buffers_t::zerofpr_buffers_t(size_t const n,
                                                    size_t const rows,
                                                    size_t const m)
{
    static_assert(sizeof(impl_t) <= sizeof(storage_type));
    static_assert(alignof(impl_t) <= alignof(storage_type));
    new (&_storage) impl_t{n, rows, m};
}

// NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init, hicpp-member-init)
ZEROFPR_EXPORT
zerofpr_buffers_t::zerofpr_buffers_t(zerofpr_buffers_t&& other) noexcept
{
    new (&_storage) impl_t{std::move(other.impl())};
}

ZEROFPR_EXPORT auto zerofpr_buffers_t::operator=(
    zerofpr_buffers_t&& other) noexcept -> zerofpr_buffers_t&
{
    impl() = std::move(other.impl());
    return *this;
}

ZEROFPR_EXPORT zerofpr_buffers_t::~zerofpr_buffers_t() noexcept
{
    impl().~impl_t();
}

ZEROFPR_EXPORT auto zerofpr_buffers_t::resize(size_t const n, size_t const rows,
                                              size_t const m) -> void
{
    impl().resize(n, rows, m);
}

ZEROFPR_EXPORT auto zerofpr_buffers_t::make_state() noexcept -> zerofpr_state_t
{
    return impl().make_state();
}
// =============================== Buffers ================================= }}}

namespace detail {
// =========================== Iteration history =========================== {{{
ZEROFPR_EXPORT auto lbfgs_history_t::update(
    gsl::span<double const> x, gsl::span<double const> x_prev,
    gsl::span<double const> r, gsl::span<double const> r_prev) noexcept -> bool
{
    ZEROFPR_ASSERT(x.size() == x_prev.size() && x.size() == r.size()
                       && x.size() == r_prev.size(),
                   "incompatible dimensions");
    if (capacity() == 0) { return false; }

    auto s_dot_y = 0.0;
    auto s_dot_s = 0.0;
    auto y_dot_y = 0.0;
    for (auto i = size_t{0}; i < x.size(); ++i) {
        auto const s = x[i] - x_prev[i];
        auto const y = r[i] - r_prev[i];
        s_dot_y += s * y;
        s_dot_s += s * s;
        y_dot_y += y * y;
    }
    if (!std::isfinite(s_dot_y) || !std::isfinite(s_dot_s)
        || !std::isfinite(y_dot_y)) {
        ZEROFPR_TRACE("skipping non-finite pair: sᵗy=%f, sᵗs=%f, yᵗy=%f\n",
                      s_dot_y, s_dot_s, y_dot_y);
        return false;
    }
    constexpr auto epsilon = std::numeric_limits<double>::epsilon();
    if (!(s_dot_y > epsilon * std::sqrt(s_dot_s) * std::sqrt(y_dot_y))) {
        ZEROFPR_TRACE("skipping pair with sᵗy=%.10e\n", s_dot_y);
        return false;
    }

    auto* slot = static_cast<iteration_data_t*>(nullptr);
    if (_size == capacity()) {
        // Full: overwrite the oldest pair
        slot   = &_data[_first];
        _first = sum(_first, 1);
    }
    else {
        slot = &_data[sum(_first, _size)];
        ++_size;
    }
    subtract(x, x_prev, slot->s);
    subtract(r, r_prev, slot->y);
    slot->s_dot_y = s_dot_y;
    slot->alpha   = std::numeric_limits<double>::quiet_NaN();
    _h0           = s_dot_y / y_dot_y;
    return true;
}

ZEROFPR_EXPORT auto lbfgs_history_t::apply(gsl::span<double const> r,
                                           gsl::span<double> d) noexcept
    -> void
{
    ZEROFPR_ASSERT(r.size() == d.size(), "incompatible dimensions");
    ZEROFPR_ASSERT(r.data() + r.size() <= d.data()
                       || d.data() + d.size() <= r.data(),
                   "`r` and `d` may not overlap");
    copy(r, d);
    for (auto i = size(); i-- > 0;) {
        auto& e = (*this)[i];
        e.alpha = dot(as_const(e.s), as_const(d)) / e.s_dot_y;
        axpy(-e.alpha, as_const(e.y), d);
    }
    scal(_h0, d);
    for (auto i = size_t{0}; i < size(); ++i) {
        auto&      e    = (*this)[i];
        auto const beta = dot(as_const(e.y), as_const(d)) / e.s_dot_y;
        axpy(e.alpha - beta, as_const(e.s), d);
    }
    scal(-1.0, d);

    if (!std::isfinite(nrm2(as_const(d)))) {
        ZEROFPR_TRACE("%s\n", "falling back to d = -r");
        negative_copy(r, d);
    }
}
// =========================== Iteration history =========================== }}}

// ============================== Reporting ================================ {{{
ZEROFPR_EXPORT auto print_header(std::FILE* stream) -> void
{
    std::fprintf(stream, "%6s  %12s  %12s  %12s  %10s\n", "iter", "gamma",
                 "normfpr", "cost", "time");
}

ZEROFPR_EXPORT auto print_row(std::FILE* stream, unsigned const iteration,
                              zerofpr_state_t const& state) -> void
{
    std::fprintf(stream, "%6u  %12.5e  %12.5e  %12.5e  %10.3e\n", iteration,
                 state.gamma, state.normfpr, state.cost, state.time);
}
// ============================== Reporting ================================ }}}
} // namespace detail

ZEROFPR_EXPORT auto print_summary(std::FILE* stream,
                                  zerofpr_result_t const& result) -> void
{
    std::fprintf(stream,
                 "status: %s\n"
                 "iterations: %u\n"
                 "normfpr: %.10e\n"
                 "cost: %.10e\n"
                 "gamma: %.10e\n"
                 "time: %.3e s\n"
                 "matvecs: %u, prox evaluations: %u\n"
                 "line search failures: %u (γ), %u (τ)\n",
                 make_error_code(result.status).message().c_str(),
                 result.num_iter, result.normfpr, result.cost, result.gamma,
                 result.time, result.num_matvec, result.num_prox,
                 result.num_gamma_failures, result.num_tau_failures);
}

ZEROFPR_NAMESPACE_END
