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
#include "operator.hpp"

#if defined(ZEROFPR_CLANG)
#    pragma clang diagnostic push
#    pragma clang diagnostic ignored "-Wweak-vtables"
#    pragma clang diagnostic ignored "-Wunused-template"
#endif
#include <gsl/gsl-lite.hpp>
#if defined(ZEROFPR_CLANG)
#    pragma clang diagnostic pop
#endif

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstring> // std::memcpy
#include <limits>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

/// \file zerofpr.hpp
///
/// ZeroFPR: forward-backward splitting accelerated by L-BFGS directions for
/// problems of the form `minimize ½‖A·x‖² + g(x)`.

ZEROFPR_NAMESPACE_BEGIN

enum class verbosity_t {
    off,             ///< Print nothing
    periodic,        ///< Print every #zerofpr_param_t::report_every iterations
    every_iteration, ///< Print every iteration
};

struct zerofpr_param_t {
    /// Tolerance of the default stopping criterion:
    /// `‖x - x̄‖₂ <= tol·max(1, ‖x₀ - x̄₀‖₂)`.
    double tol;
    /// Maximum number of iterations to perform.
    unsigned max_iter;
    /// Number of secant pairs used for representing the inverse Hessian.
    unsigned m;
    /// Verbosity level.
    verbosity_t verbose;
    /// Report period for #verbosity_t::periodic.
    unsigned report_every;
    /// Where progress is printed. `nullptr` means `stdout`.
    std::FILE* report_stream;
    /// \brief Initial step size γ.
    ///
    /// NaN means that γ will be estimated from the upper bound on the
    /// Lipschitz constant of ∇f computed using finite differences.
    double gamma;
    /// Whether to run a line search on γ.
    bool line_search;
    /// Safety constant β ∈ (0, 1): `γ = (1 - β)/L` and `σ = β/(4γ)`.
    double beta;
    /// Maximum number of times γ is halved within one iteration.
    unsigned max_gamma_trials;
    /// Maximum number of step lengths τ tried within one iteration.
    unsigned max_tau_trials;
    /// τ is multiplied by this factor after each unsuccessful trial.
    double tau_shrink;

    /// Some sane defaults for the parameters.
    constexpr zerofpr_param_t() noexcept
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        : tol{1e-8}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , max_iter{10000}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , m{5}
        , verbose{verbosity_t::periodic}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , report_every{100}
        , report_stream{nullptr}
        , gamma{std::numeric_limits<double>::quiet_NaN()}
        , line_search{true}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , beta{0.05}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , max_gamma_trials{32}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , max_tau_trials{32}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , tau_shrink{0.4}
    {}
};

struct zerofpr_result_t {
    status_t status;             ///< Termination status
    unsigned num_iter;           ///< Number of completed iterations
    double   normfpr;            ///< Final fixed-point residual `‖x - x̄‖₂`
    double   cost;               ///< Final cost `f(x̄) + g(x̄)`
    double   gamma;              ///< Final step size γ
    double   time;               ///< Wall time in seconds
    unsigned num_matvec;         ///< Number of applications of A and Aᵗ
    unsigned num_prox;           ///< Number of proximal operator evaluations
    unsigned num_gamma_failures; ///< Line searches on γ which ran out of trials
    unsigned num_tau_failures;   ///< Line searches on τ which ran out of trials
};

/// Prints a short summary of a finished run to \p stream.
auto print_summary(std::FILE* stream, zerofpr_result_t const& result) -> void;

namespace detail {
auto dot(gsl::span<double const> a, gsl::span<double const> b) noexcept
    -> double;
auto nrm2(gsl::span<double const> x) noexcept -> double;
auto axpy(double a, gsl::span<double const> x, gsl::span<double> y) noexcept
    -> void;
auto axpy(double a, gsl::span<double const> x, gsl::span<double const> y,
          gsl::span<double> out) noexcept -> void;
auto scal(double a, gsl::span<double> x) noexcept -> void;
auto copy(gsl::span<double const> src, gsl::span<double> dst) noexcept -> void;
auto negative_copy(gsl::span<double const> src, gsl::span<double> dst) noexcept
    -> void;
/// `out ← x - y`
auto subtract(gsl::span<double const> x, gsl::span<double const> y,
              gsl::span<double> out) noexcept -> void;

/// Checks \p p for validity.
inline auto check_parameters(zerofpr_param_t const& p) noexcept -> status_t
{
    if (!(p.tol > 0.0) || std::isinf(p.tol)) {
        return status_t::invalid_tolerance;
    }
    if (!std::isnan(p.gamma) && (!(p.gamma > 0.0) || std::isinf(p.gamma))) {
        return status_t::invalid_step_size;
    }
    if (!(p.beta > 0.0 && p.beta < 1.0)) { return status_t::invalid_beta; }
    if (p.max_gamma_trials == 0 || p.max_tau_trials == 0) {
        return status_t::invalid_trial_budget;
    }
    if (!(p.tau_shrink > 0.0 && p.tau_shrink < 1.0)) {
        return status_t::invalid_shrink_factor;
    }
    if (p.verbose == verbosity_t::periodic && p.report_every == 0) {
        return status_t::invalid_report_interval;
    }
    return status_t::success;
}

template <class T>
ZEROFPR_FORCEINLINE constexpr auto as_const(T& x) noexcept -> T const&
{
    return x;
}

struct iteration_data_t {
    double            s_dot_y;
    double            alpha;
    gsl::span<double> s;
    gsl::span<double> y;
};

/// \brief A ring span of #iteration_data_t
///
/// Stores the last `capacity()` secant pairs `(s, y)` with `s = x̄ - x̄_prev`
/// and `y = r̄ - r̄_prev`. When full, the oldest pair is overwritten.
class lbfgs_history_t {
    static_assert(std::is_nothrow_copy_assignable_v<iteration_data_t>);
    static_assert(std::is_nothrow_move_assignable_v<iteration_data_t>);

  public:
    using size_type = size_t;

    /// Constructs an empty history object.
    explicit constexpr lbfgs_history_t(
        gsl::span<iteration_data_t> data) noexcept
        : _first{0}, _size{0}, _h0{1.0}, _data{data}
    {}

    constexpr lbfgs_history_t(lbfgs_history_t const&) noexcept = default;
    constexpr lbfgs_history_t(lbfgs_history_t&&) noexcept      = default;
    constexpr auto operator   =(lbfgs_history_t const&) noexcept
        -> lbfgs_history_t& = default;
    constexpr auto operator   =(lbfgs_history_t&&) noexcept
        -> lbfgs_history_t& = default;

    /// \brief Records a new secant pair.
    ///
    /// Pairs with `sᵗy <= ε·‖s‖₂·‖y‖₂` or non-finite entries are skipped.
    ///
    /// \return whether the pair was stored.
    auto update(gsl::span<double const> x, gsl::span<double const> x_prev,
                gsl::span<double const> r,
                gsl::span<double const> r_prev) noexcept -> bool;

    /// \brief Computes `d ← -H·r` using the two-loop recursion.
    ///
    /// With an empty history this is just `d ← -r`. \p r and \p d must not
    /// overlap.
    auto apply(gsl::span<double const> r, gsl::span<double> d) noexcept
        -> void;

    /// Forgets all stored pairs.
    constexpr auto clear() noexcept -> void
    {
        _first = 0;
        _size  = 0;
        _h0    = 1.0;
    }

    [[nodiscard]] constexpr auto capacity() const noexcept -> size_type
    {
        return _data.size();
    }
    [[nodiscard]] constexpr auto size() const noexcept -> size_type
    {
        return _size;
    }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool
    {
        return _size == 0;
    }
    /// Scaling of the initial inverse Hessian approximation: `sᵗy / yᵗy` of
    /// the most recent pair.
    [[nodiscard]] constexpr auto h0() const noexcept -> double { return _h0; }

  private:
    /// Element access by age: `0` is the oldest pair.
    [[nodiscard]] constexpr auto operator[](size_type const i) noexcept
        -> iteration_data_t&
    {
        ZEROFPR_ASSERT(i < size(), "index out of bounds");
        return _data[sum(_first, i)];
    }

    [[nodiscard]] constexpr auto sum(size_type const a,
                                     size_type const b) const noexcept
        -> size_type
    {
        auto r = a + b;
        r -= static_cast<size_type>(r >= capacity()) * capacity();
        return r;
    }

    size_type                   _first;
    size_type                   _size;
    double                      _h0;
    gsl::span<iteration_data_t> _data;
};

/// \brief Values computed from a forward-backward step.
struct envelope_t {
    double normfpr; ///< `‖x - x̄‖₂`
    double uppbnd;  ///< `f(x) - ⟨∇f(x), x - x̄⟩ + 1/(2γ)·‖x - x̄‖₂²`
    double fbe;     ///< `uppbnd + g(x̄)`
};

/// \brief Evaluates the forward-backward envelope at \p x.
///
/// Stores the fixed-point residual `x - x̄` into \p r. The result depends on
/// the inputs only, so identical inputs produce bitwise identical outputs.
auto evaluate_envelope(double f_x, gsl::span<double const> grad_x,
                       gsl::span<double const> x, gsl::span<double const> xbar,
                       double g_xbar, double gamma,
                       gsl::span<double> r) noexcept -> envelope_t;

/// `½‖v‖₂²`
inline auto half_sqr_norm(gsl::span<double const> v) noexcept -> double
{
    return 0.5 * dot(v, v);
}
} // namespace detail

/// \brief Mutable state of one run of the solver.
///
/// All vectors point into a #zerofpr_buffers_t. The state is handed to the
/// stopping criterion as a `const&`, so it can be inspected, but only the
/// solver mutates it.
struct zerofpr_state_t {
    gsl::span<double> x;         ///< Current iterate
    gsl::span<double> xbar;      ///< Forward-backward step from `x`
    gsl::span<double> xbar_prev; ///< `x̄` of the previous iteration
    gsl::span<double> r;         ///< `x - x̄`
    gsl::span<double> rbar;      ///< `x̄ - x̄̄`
    gsl::span<double> rbar_prev; ///< `r̄` of the previous iteration
    gsl::span<double> grad_x;    ///< `∇f(x) = Aᵗ·res_x`
    gsl::span<double> grad_xbar; ///< `∇f(x̄) = Aᵗ·res_xbar`
    gsl::span<double> grad_step; ///< Scratch: `x - γ·∇f(x)`
    gsl::span<double> xbarbar;   ///< Forward-backward step from `x̄`
    gsl::span<double> d;         ///< Search direction
    gsl::span<double> ATAd;      ///< `Aᵗ·A·d`
    gsl::span<double> res_x;     ///< `A·x`
    gsl::span<double> res_xbar;  ///< `A·x̄`
    gsl::span<double> Ad;        ///< `A·d` (linear part only)

    detail::lbfgs_history_t history;

    double f_x;       ///< `f(x)`
    double f_xbar;    ///< `f(x̄)`
    double g_xbar;    ///< `g(x̄)`
    double uppbnd;    ///< Quadratic upper bound on `f(x̄)` around `x`
    double fbe;       ///< Envelope at `x` after the line search on γ
    double fbe_prev;  ///< #fbe of the previous iteration
    double fbe_trial; ///< Envelope at the last point tried by the τ search
    double normfpr;   ///< `‖x - x̄‖₂`
    double normfpr_0; ///< #normfpr at the first iteration
    double cost;      ///< `f(x̄) + g(x̄)`
    double gamma;     ///< Step size γ
    double sigma;     ///< `β/(4γ)`
    double tau;       ///< Last step length tried along #d
    double level;     ///< `fbe - σ·normfpr²` which the τ search must reach
    double time;      ///< Seconds since the start of the run

    unsigned iteration;          ///< Number of completed iterations
    unsigned num_matvec;         ///< Applications of A and Aᵗ
    unsigned num_prox;           ///< Proximal operator evaluations
    unsigned num_gamma_failures; ///< Exhausted line searches on γ
    unsigned num_tau_failures;   ///< Exhausted line searches on τ
};

/// \brief Memory used by one run of the solver.
///
/// A single buffer may be reused by consecutive runs, but never by two runs at
/// the same time.
struct zerofpr_buffers_t {
  private:
    struct impl_t;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
    using storage_type = std::aligned_storage_t<64, 8>;

    storage_type _storage;

    inline auto impl() noexcept -> impl_t&;

  public:
    zerofpr_buffers_t() noexcept;
    /// \param n    number of variables.
    /// \param rows size of the codomain of A.
    /// \param m    number of secant pairs to keep.
    zerofpr_buffers_t(size_t n, size_t rows, size_t m);

    zerofpr_buffers_t(zerofpr_buffers_t const&) = delete;
    zerofpr_buffers_t(zerofpr_buffers_t&&) noexcept;
    auto operator=(zerofpr_buffers_t const&) -> zerofpr_buffers_t& = delete;
    auto operator=(zerofpr_buffers_t&&) noexcept -> zerofpr_buffers_t&;
    ~zerofpr_buffers_t() noexcept;

    /// \throws std::bad_alloc or std::overflow_error if memory can't be
    /// allocated.
    auto resize(size_t n, size_t rows, size_t m) -> void;
    auto make_state() noexcept -> zerofpr_state_t;
};

/// \brief Default stopping criterion.
///
/// Stops when `‖x - x̄‖₂ <= tol·max(1, normfpr₀)`. Before the first iteration
/// normfpr₀ is not known and is treated as 1.
struct normfpr_small_enough_fn {
    double tol;

    auto operator()(zerofpr_state_t const& state, double const normfpr_0,
                    double /*fbe_curr*/, double /*fbe_prev*/) const noexcept
        -> bool
    {
        auto const scale =
            std::isnan(normfpr_0) ? 1.0 : std::max(normfpr_0, 1.0);
        auto const result = state.normfpr <= tol * scale;
        ZEROFPR_TRACE("is residual small? %.10e <= %.10e * %.10e? -> %i\n",
                      state.normfpr, tol, scale, result);
        return result;
    }
};

namespace detail {
auto print_header(std::FILE* stream) -> void;
auto print_row(std::FILE* stream, unsigned iteration,
               zerofpr_state_t const& state) -> void;

/// \brief Calls into the operator and the proximal operator.
///
/// Every call goes through here so that #zerofpr_state_t::num_matvec and
/// #zerofpr_state_t::num_prox count exactly the work done.
template <class Operator, class Prox> struct oracle_t {
    Operator const&  op;
    Prox&            prox;
    zerofpr_state_t& state;

    auto apply(gsl::span<double const> x, gsl::span<double> y) -> void
    {
        op.apply(x, y);
        ++state.num_matvec;
    }

    auto apply_linear_part(gsl::span<double const> x, gsl::span<double> y)
        -> void
    {
        detail::apply_linear_part(op, x, y);
        ++state.num_matvec;
    }

    auto apply_adjoint(gsl::span<double const> y, gsl::span<double> x) -> void
    {
        op.apply_adjoint(y, x);
        ++state.num_matvec;
    }

    /// Computes `out ← prox_{γg}(x - γ·grad)` and returns `g(out)`.
    auto forward_backward(gsl::span<double const> x,
                          gsl::span<double const> grad, gsl::span<double> out)
        -> double
    {
        axpy(-state.gamma, grad, x, state.grad_step);
        // Yes, we want implicit conversion to double here!
        double const g = prox(as_const(state.grad_step), state.gamma, out);
        ++state.num_prox;
        return g;
    }
};

/// Recomputes `r`, `normfpr` and `uppbnd` from the current `x`, `x̄` pair and
/// returns the envelope value.
inline auto update_envelope(zerofpr_state_t& state) noexcept -> double
{
    auto const e = evaluate_envelope(
        state.f_x, as_const(state.grad_x), as_const(state.x),
        as_const(state.xbar), state.g_xbar, state.gamma, state.r);
    state.normfpr = e.normfpr;
    state.uppbnd  = e.uppbnd;
    return e.fbe;
}

/// \brief Upper bound on the Lipschitz constant of ∇f.
///
/// Uses finite differences: `‖∇f(x) - ∇f(x + δ)‖₂ / ‖δ‖₂` with `δ = √ε·1`.
/// Expects `grad_x` to hold `∇f(x)`. `grad_step`, `res_xbar` and `grad_xbar`
/// are used as scratch space.
template <class Oracle>
auto estimate_lipschitz(Oracle& oracle, zerofpr_state_t& state) -> double
{
    constexpr auto epsilon = std::numeric_limits<double>::epsilon();
    auto const     delta   = std::sqrt(epsilon);
    for (auto i = size_t{0}; i < state.x.size(); ++i) {
        state.grad_step[i] = state.x[i] + delta;
    }
    oracle.apply(as_const(state.grad_step), state.res_xbar);
    oracle.apply_adjoint(as_const(state.res_xbar), state.grad_xbar);
    subtract(as_const(state.grad_x), as_const(state.grad_xbar),
             state.grad_step);
    auto const lipschitz =
        nrm2(as_const(state.grad_step))
        / std::sqrt(epsilon * static_cast<double>(state.x.size()));
    ZEROFPR_TRACE("L = %.10e\n", lipschitz);
    return lipschitz;
}

/// \brief Line search on the step size γ.
///
/// Halves γ until `f(x̄) <= uppbnd`, i.e. until the quadratic model of f around
/// `x` majorizes f at `x̄`. Expects `f_xbar` and `res_xbar` to be up-to-date.
/// Stops as soon as `f(x̄)` or `uppbnd` is not finite.
struct gamma_search_fn {
    zerofpr_state_t&       state;
    zerofpr_param_t const& params;

    /// \return whether the condition holds for the final γ.
    template <class Oracle> auto operator()(Oracle& oracle) const -> bool
    {
        for (auto j = 0U;; ++j) {
            if (!std::isfinite(state.f_xbar) || !std::isfinite(state.uppbnd)) {
                return false;
            }
            if (state.f_xbar <= state.uppbnd) { return true; }
            if (j == params.max_gamma_trials) { break; }
            state.gamma *= 0.5;
            state.sigma *= 2.0;
            state.g_xbar = oracle.forward_backward(
                as_const(state.x), as_const(state.grad_x), state.xbar);
            update_envelope(state);
            oracle.apply(as_const(state.xbar), state.res_xbar);
            state.f_xbar = half_sqr_norm(as_const(state.res_xbar));
            ZEROFPR_TRACE("γ=%.5e: f(x̄)=%.10e, uppbnd=%.10e\n", state.gamma,
                          state.f_xbar, state.uppbnd);
        }
        ++state.num_gamma_failures;
        return false;
    }
};

/// \brief Line search on the step length τ along the direction `d`.
///
/// Tries `x = x̄_prev + τ·d` for `τ = 1, κ, κ², ...` until the envelope drops
/// to `level = fbe - σ·normfpr²`. Since A is linear, `A·x` and `∇f(x)` are
/// updated from `A·d` and `Aᵗ·A·d`, which are computed only once. Gives up
/// at the first non-finite envelope value.
struct tau_search_fn {
    zerofpr_state_t&       state;
    zerofpr_param_t const& params;

    /// \return whether the envelope reached the level.
    template <class Oracle> auto operator()(Oracle& oracle) const -> bool
    {
        state.level = state.fbe - state.sigma * state.normfpr * state.normfpr;
        oracle.apply_linear_part(as_const(state.d), state.Ad);
        oracle.apply_adjoint(as_const(state.Ad), state.ATAd);
        state.tau = 1.0;
        for (auto j = 0U; j < params.max_tau_trials; ++j) {
            if (j != 0) { state.tau *= params.tau_shrink; }
            axpy(state.tau, as_const(state.d), as_const(state.xbar_prev),
                 state.x);
            axpy(state.tau, as_const(state.Ad), as_const(state.res_xbar),
                 state.res_x);
            state.f_x = half_sqr_norm(as_const(state.res_x));
            axpy(state.tau, as_const(state.ATAd), as_const(state.grad_xbar),
                 state.grad_x);
            state.g_xbar = oracle.forward_backward(
                as_const(state.x), as_const(state.grad_x), state.xbar);
            state.fbe_trial = update_envelope(state);
            ZEROFPR_TRACE("τ=%.5e: FBE=%.10e, level=%.10e\n", state.tau,
                          state.fbe_trial, state.level);
            if (!std::isfinite(state.fbe_trial)) { return false; }
            if (state.fbe_trial <= state.level) { return true; }
        }
        ++state.num_tau_failures;
        return false;
    }
};

/// Prints progress according to #zerofpr_param_t::verbose.
struct status_reporter_fn {
    zerofpr_state_t const& state;
    zerofpr_param_t const& params;

    /// Reports the iteration which is currently in progress.
    auto operator()() const -> void
    {
        auto const k = state.iteration + 1;
        switch (params.verbose) {
        case verbosity_t::off: return;
        case verbosity_t::periodic:
            if (k != 1 && k % params.report_every != 0) { return; }
            break;
        case verbosity_t::every_iteration: break;
        } // end switch
        if (k == 1) { print_header(stream()); }
        print_row(stream(), k, state);
    }

    /// Reports the final state.
    auto done() const -> void
    {
        if (params.verbose == verbosity_t::off) { return; }
        if (state.iteration == 0) { print_header(stream()); }
        print_row(stream(), state.iteration, state);
    }

  private:
    auto stream() const noexcept -> std::FILE*
    {
        return params.report_stream != nullptr ? params.report_stream : stdout;
    }
};

inline auto make_result(status_t const status, zerofpr_state_t const& state)
    -> zerofpr_result_t
{
    return {status,
            state.iteration,
            state.normfpr,
            state.cost,
            state.gamma,
            state.time,
            state.num_matvec,
            state.num_prox,
            state.num_gamma_failures,
            state.num_tau_failures};
}

inline auto is_finite(double const x) noexcept -> bool
{
    return std::isfinite(x);
}

/// Last accepted x̄ together with its diagnostics.
struct accepted_t {
    gsl::span<double const> xbar; ///< Buffer which currently holds x̄
    double                  normfpr;
    double                  cost;
    double                  gamma;
};

/// \brief Runs the solver.
///
/// Expects `state.x` to hold the initial point. On return `state.xbar` holds
/// the solution. On #status_t::non_finite_value it holds the last accepted x̄
/// instead, and `normfpr`, `cost` and `gamma` are those of that point.
template <class Operator, class Prox, class Halt>
auto minimize(Operator const& op, Prox& prox, Halt& halt,
              zerofpr_param_t const& params, zerofpr_state_t& state)
    -> zerofpr_result_t
{
    using clock      = std::chrono::steady_clock;
    auto const start = clock::now();
    auto const tick  = [&state, start]() {
        state.time =
            std::chrono::duration<double>(clock::now() - start).count();
    };

    auto oracle = oracle_t<Operator, Prox>{op, prox, state};
    gamma_search_fn    search_gamma{state, params};
    tau_search_fn      search_tau{state, params};
    status_reporter_fn report{state, params};

    auto const finish = [&](status_t const status) {
        tick();
        report.done();
        return make_result(status, state);
    };

    // Nothing is accepted yet, so a failure during initialisation hands back
    // the initial point.
    auto last = accepted_t{as_const(state.x), state.normfpr, state.cost,
                           state.gamma};
    auto const accept = [&state, &last]() {
        last = {as_const(state.xbar), state.normfpr, state.cost, state.gamma};
    };
    auto const fail = [&]() {
        if (last.xbar.data() != state.xbar.data()) {
            copy(last.xbar, state.xbar);
        }
        state.normfpr = last.normfpr;
        state.cost    = last.cost;
        state.gamma   = last.gamma;
        return finish(status_t::non_finite_value);
    };

    oracle.apply(as_const(state.x), state.res_x);
    state.f_x = half_sqr_norm(as_const(state.res_x));
    oracle.apply_adjoint(as_const(state.res_x), state.grad_x);
    if (!is_finite(state.f_x)) { return fail(); }

    if (std::isnan(params.gamma)) {
        auto lipschitz = estimate_lipschitz(oracle, state);
        if (!is_finite(lipschitz)) { return fail(); }
        // ∇f is (numerically) constant, any step size will do
        if (lipschitz < std::numeric_limits<double>::epsilon()) {
            lipschitz = 1.0;
        }
        state.gamma = (1.0 - params.beta) / lipschitz;
    }
    else {
        state.gamma = params.gamma;
    }
    state.sigma = params.beta / (4.0 * state.gamma);

    // Evaluates f at a newly accepted x̄
    auto const evaluate_xbar = [&oracle, &state]() {
        oracle.apply(as_const(state.xbar), state.res_xbar);
        state.f_xbar = half_sqr_norm(as_const(state.res_xbar));
        state.cost   = state.f_xbar + state.g_xbar;
        return is_finite(state.cost);
    };

    state.g_xbar = oracle.forward_backward(as_const(state.x),
                                           as_const(state.grad_x), state.xbar);
    state.fbe = update_envelope(state);
    if (!is_finite(state.fbe) || !evaluate_xbar()) { return fail(); }
    accept();

    for (;;) {
        if (halt(as_const(state), state.normfpr_0, state.fbe,
                 state.fbe_prev)) {
            return finish(status_t::success);
        }
        if (state.iteration == params.max_iter) {
            return finish(status_t::too_many_iterations);
        }
        state.fbe_prev = state.fbe;

        if (params.line_search) {
            // x̄̄ is not needed until the next forward-backward step, so it
            // keeps the accepted x̄ while γ search overwrites x̄
            copy(as_const(state.xbar), state.xbarbar);
            last.xbar = as_const(state.xbarbar);
            search_gamma(oracle);
        }
        if (state.iteration == 0) { state.normfpr_0 = state.normfpr; }

        state.fbe  = state.uppbnd + state.g_xbar;
        state.cost = state.f_xbar + state.g_xbar;
        if (!is_finite(state.fbe) || !is_finite(state.cost)) { return fail(); }
        accept();
        tick();
        report();

        // r̄ = x̄ - x̄̄ where x̄̄ is the forward-backward step from x̄
        oracle.apply_adjoint(as_const(state.res_xbar), state.grad_xbar);
        oracle.forward_backward(as_const(state.xbar), as_const(state.grad_xbar),
                                state.xbarbar);
        subtract(as_const(state.xbar), as_const(state.xbarbar), state.rbar);

        if (state.iteration == 0) {
            negative_copy(as_const(state.rbar), state.d);
        }
        else {
            state.history.update(as_const(state.xbar), as_const(state.xbar_prev),
                                 as_const(state.rbar),
                                 as_const(state.rbar_prev));
            state.history.apply(as_const(state.rbar), state.d);
        }
        copy(as_const(state.rbar), state.rbar_prev);
        copy(as_const(state.xbar), state.xbar_prev);
        last.xbar = as_const(state.xbar_prev);

        search_tau(oracle);
        if (!is_finite(state.fbe_trial) || !evaluate_xbar()) { return fail(); }
        accept();
        ++state.iteration;
    }
}

template <class Prox>
constexpr auto is_prox_v = std::is_invocable_r_v<double, Prox&,
                                                 gsl::span<double const>,
                                                 double, gsl::span<double>>;

template <class Halt>
constexpr auto is_halt_v =
    std::is_invocable_r_v<bool, Halt&, zerofpr_state_t const&, double, double,
                          double>;

inline auto failed_result(status_t const status, double const gamma) noexcept
    -> zerofpr_result_t
{
    constexpr auto NaN = std::numeric_limits<double>::quiet_NaN();
    return {status, 0, NaN, NaN, gamma, 0.0, 0, 0, 0, 0};
}
} // namespace detail

/// \brief Minimizes `½‖A·x‖² + g(x)` starting at \p x.
///
/// \param op     linear or affine operator A (see operator.hpp).
/// \param prox   proximal operator of g (see prox.hpp).
/// \param params solver parameters.
/// \param x      initial point. On return it holds the final `x̄` unless the
///               parameters, dimensions or memory allocation were invalid.
/// \param halt   stopping criterion with the signature
///               `auto (zerofpr_state_t const&, double normfpr_0,
///               double fbe_curr, double fbe_prev) -> bool`. Exceptions
///               thrown by it propagate to the caller, and \p x is then left
///               untouched.
/// \param buffers workspace to use.
template <class Operator, class Prox, class Halt>
auto minimize(Operator const& op, Prox&& prox, zerofpr_param_t const& params,
              gsl::span<double> x, Halt&& halt, zerofpr_buffers_t& buffers)
    -> zerofpr_result_t
{
    static_assert(
        detail::is_prox_v<std::remove_reference_t<Prox>>,
        "`Prox` should have a signature `auto (gsl::span<double const>, "
        "double, gsl::span<double>) -> double`.");
    static_assert(detail::is_halt_v<std::remove_reference_t<Halt>>,
                  "`Halt` should have a signature `auto (zerofpr_state_t "
                  "const&, double, double, double) -> bool`.");

    if (auto status = detail::check_parameters(params);
        ZEROFPR_UNLIKELY(status != status_t::success)) {
        return detail::failed_result(status, params.gamma);
    }
    if (ZEROFPR_UNLIKELY(x.size() != op.cols())) {
        return detail::failed_result(status_t::dimension_mismatch,
                                     params.gamma);
    }
    if (ZEROFPR_UNLIKELY(x.empty())) {
        return detail::failed_result(status_t::invalid_argument, params.gamma);
    }
    try {
        buffers.resize(x.size(), op.rows(), params.m);
    }
    catch (std::bad_alloc&) {
        return detail::failed_result(status_t::out_of_memory, params.gamma);
    }
    catch (std::overflow_error&) {
        return detail::failed_result(status_t::out_of_memory, params.gamma);
    }
    auto state = buffers.make_state();
    std::memcpy(state.x.data(), x.data(), x.size() * sizeof(double));
    auto const result = detail::minimize(op, prox, halt, params, state);
    std::memcpy(x.data(), detail::as_const(state.xbar).data(),
                x.size() * sizeof(double));
    return result;
}

/// \overload
template <class Operator, class Prox, class Halt>
auto minimize(Operator const& op, Prox&& prox, zerofpr_param_t const& params,
              gsl::span<double> x, Halt&& halt) -> zerofpr_result_t
{
    zerofpr_buffers_t buffers;
    return minimize(op, std::forward<Prox>(prox), params, x,
                    std::forward<Halt>(halt), buffers);
}

/// \overload
///
/// Uses #normfpr_small_enough_fn as the stopping criterion.
template <class Operator, class Prox>
auto minimize(Operator const& op, Prox&& prox, zerofpr_param_t const& params,
              gsl::span<double> x) -> zerofpr_result_t
{
    return minimize(op, std::forward<Prox>(prox), params, x,
                    normfpr_small_enough_fn{params.tol});
}

ZEROFPR_NAMESPACE_END
