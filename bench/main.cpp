#include "core.hpp"
#include "zerofpr/prox.hpp"
#include "zerofpr/zerofpr.hpp"

#include <benchmark/benchmark.h>

#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

namespace zerofpr = ::ZEROFPR_NAMESPACE;

static void bm_apply(benchmark::State& state)
{
    auto const rows    = static_cast<size_t>(state.range(0));
    auto const cols    = static_cast<size_t>(state.range(1));
    auto const problem = make_lasso(rows, cols, 0.1, 1);
    std::vector<double> x(cols, 1.0);
    std::vector<double> y(rows);
    for (auto _ : state) {
        problem.op.apply(x, y);
        benchmark::DoNotOptimize(y.data());
    }
}

static void bm_apply_adjoint(benchmark::State& state)
{
    auto const rows    = static_cast<size_t>(state.range(0));
    auto const cols    = static_cast<size_t>(state.range(1));
    auto const problem = make_lasso(rows, cols, 0.1, 1);
    std::vector<double> y(rows, 1.0);
    std::vector<double> x(cols);
    for (auto _ : state) {
        problem.op.apply_adjoint(y, x);
        benchmark::DoNotOptimize(x.data());
    }
}

static void bm_lbfgs_direction(benchmark::State& state)
{
    auto const n = static_cast<size_t>(state.range(0));
    auto const m = static_cast<size_t>(state.range(1));
    std::mt19937                     gen{3};
    std::normal_distribution<double> normal;
    auto const random = [&](size_t const size) {
        std::vector<double> v(size);
        std::generate(v.begin(), v.end(), [&]() { return normal(gen); });
        return v;
    };

    std::vector<double>                    workspace(2 * n * m);
    std::vector<zerofpr::detail::iteration_data_t> data(m);
    for (auto i = size_t{0}; i < m; ++i) {
        data[i].s = {workspace.data() + 2 * i * n, n};
        data[i].y = {workspace.data() + (2 * i + 1) * n, n};
    }
    zerofpr::detail::lbfgs_history_t history{{data}};
    std::vector<double> const zeros(n, 0.0);
    while (history.size() < m) {
        // y = s + small perturbation keeps sᵗy > 0
        auto const s = random(n);
        auto       y = random(n);
        for (auto i = size_t{0}; i < n; ++i) {
            y[i] = s[i] + 0.1 * y[i];
        }
        if (!history.update(s, zeros, y, zeros)) {
            throw std::runtime_error{"failed to fill the history"};
        }
    }

    auto const          r = random(n);
    std::vector<double> d(n);
    for (auto _ : state) {
        history.apply(r, d);
        benchmark::DoNotOptimize(d.data());
    }
}

static void bm_lasso(benchmark::State& state)
{
    auto const rows    = static_cast<size_t>(state.range(0));
    auto const cols    = static_cast<size_t>(state.range(1));
    auto const problem = make_lasso(rows, cols, 0.1, 2);
    zerofpr::zerofpr_param_t params;
    params.verbose = zerofpr::verbosity_t::off;
    params.tol     = 1e-6;

    auto iterations = 0U;
    for (auto _ : state) {
        std::vector<double> x(cols, 0.0);
        auto const          r = zerofpr::minimize(
            problem.op, zerofpr::norm_l1_fn{problem.lambda}, params, x);
        if (r.status != zerofpr::status_t::success) {
            state.SkipWithError(
                make_error_code(r.status).message().c_str());
            break;
        }
        iterations = r.num_iter;
    }
    state.counters["iterations"] = iterations;
}

static void bm_lasso_reuse_buffers(benchmark::State& state)
{
    auto const rows    = static_cast<size_t>(state.range(0));
    auto const cols    = static_cast<size_t>(state.range(1));
    auto const problem = make_lasso(rows, cols, 0.1, 2);
    zerofpr::zerofpr_param_t params;
    params.verbose = zerofpr::verbosity_t::off;
    params.tol     = 1e-6;

    zerofpr::zerofpr_buffers_t buffers{cols, rows, params.m};
    for (auto _ : state) {
        std::vector<double> x(cols, 0.0);
        auto const          r = zerofpr::minimize(
            problem.op, zerofpr::norm_l1_fn{problem.lambda}, params, x,
            zerofpr::normfpr_small_enough_fn{params.tol}, buffers);
        if (r.status != zerofpr::status_t::success) {
            state.SkipWithError(
                make_error_code(r.status).message().c_str());
            break;
        }
    }
}

BENCHMARK(bm_apply)->Args({500, 250})->Args({2000, 1000});
BENCHMARK(bm_apply_adjoint)->Args({500, 250})->Args({2000, 1000});
BENCHMARK(bm_lbfgs_direction)->Args({1000, 5})->Args({100000, 5})->Args({100000, 20});
BENCHMARK(bm_lasso)->Args({100, 50})->Args({500, 250})->Args({2000, 1000});
BENCHMARK(bm_lasso_reuse_buffers)->Args({100, 50})->Args({500, 250});

BENCHMARK_MAIN();
