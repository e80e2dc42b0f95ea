#include "zerofpr/prox.hpp"
#include "zerofpr/zerofpr.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <vector>

// Recovers a sparse vector from noisy linear measurements by solving
//
//     minimize ½‖A·x - b‖² + λ‖x‖₁
//
// Usage: lasso [rows] [cols] [λ]
int main(int argc, char** argv)
{
    namespace zerofpr = ::ZEROFPR_NAMESPACE;

    auto const rows =
        argc > 1 ? static_cast<size_t>(std::strtoul(argv[1], nullptr, 10)) : 200;
    auto const cols =
        argc > 2 ? static_cast<size_t>(std::strtoul(argv[2], nullptr, 10)) : 500;
    auto const lambda = argc > 3 ? std::strtod(argv[3], nullptr) : 0.05;
    if (rows == 0 || cols == 0) {
        std::fprintf(stderr, "rows and cols must be positive\n");
        return EXIT_FAILURE;
    }

    std::mt19937                     gen{12345};
    std::normal_distribution<double> normal;
    std::vector<double>              data(rows * cols);
    for (auto& a : data) {
        a = normal(gen) / std::sqrt(static_cast<double>(rows));
    }
    zerofpr::dense_matrix_t A{rows, cols, std::move(data)};

    // Ground truth with 5% nonzeros
    std::vector<double> x_true(cols, 0.0);
    for (auto i = size_t{0}; i < cols; i += 20) {
        x_true[i] = normal(gen);
    }
    std::vector<double> b(rows);
    A.apply(x_true, b);

    zerofpr::affine_t const  op{std::move(A), std::move(b)};
    zerofpr::zerofpr_param_t params;
    params.tol          = 1e-10;
    params.report_every = 10;

    std::vector<double> x(cols, 0.0);
    auto const r = zerofpr::minimize(op, zerofpr::norm_l1_fn{lambda}, params, x);
    zerofpr::print_summary(stdout, r);

    auto error = 0.0;
    auto nnz   = size_t{0};
    for (auto i = size_t{0}; i < cols; ++i) {
        error += (x[i] - x_true[i]) * (x[i] - x_true[i]);
        nnz += x[i] != 0.0;
    }
    std::printf("nonzeros: %zu, distance to ground truth: %.5e\n", nnz,
                std::sqrt(error));
    return r.status == zerofpr::status_t::success ? EXIT_SUCCESS
                                                  : EXIT_FAILURE;
}
