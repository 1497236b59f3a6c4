#include "bfgs/bfgs.hpp"

#include <benchmark/benchmark.h>

#include <algorithm>
#include <random>
#include <vector>

namespace {
auto make_random_vector(size_t const size)
{
    std::vector<double> buffer(size);
    std::mt19937        gen{std::random_device{}()};
    std::generate(buffer.begin(), buffer.end(), [&gen]() {
        return std::uniform_real_distribution<double>{-1.0, 1.0}(gen);
    });
    return buffer;
}

/// `f(x) = Σᵢ (i + 1)·(xᵢ - 1)²`
auto diagonal_quadratic(gsl::span<double const> const x,
                        gsl::span<double> const       grad) -> double
{
    auto f_x = 0.0;
    for (auto i = size_t{0}; i < x.size(); ++i) {
        auto const w = static_cast<double>(i + 1);
        auto const t = x[i] - 1.0;
        grad[i]      = 2.0 * w * t;
        f_x += w * t * t;
    }
    return f_x;
}

auto rosenbrock(gsl::span<double const> const x,
                gsl::span<double> const       grad) -> double
{
    auto f_x = 0.0;
    for (auto i = size_t{0}; i < x.size(); i += 2) {
        auto const t1 = 1.0 - x[i];
        auto const t2 = 10.0 * (x[i + 1] - x[i] * x[i]);
        grad[i + 1]   = 20.0 * t2;
        grad[i]       = -2.0 * (20.0 * x[i] * t2 + t1);
        f_x += t1 * t1 + t2 * t2;
    }
    return f_x;
}

template <class Function>
auto run(benchmark::State& state, Function value_and_gradient,
         std::vector<double> const& x0) -> void
{
    auto const value = [value_and_gradient](gsl::span<double const> x) {
        std::vector<double> grad(x.size());
        return value_and_gradient(x, grad);
    };
    auto const objective =
        ::BFGS_NAMESPACE::make_objective(value, value_and_gradient);
    ::BFGS_NAMESPACE::bfgs_param_t params;
    params.max_iter = 1000;

    std::vector<double> x(x0.size());
    for (auto _ : state) {
        std::copy(x0.begin(), x0.end(), x.begin());
        auto const result = ::BFGS_NAMESPACE::minimize(objective, params, x);
        benchmark::DoNotOptimize(result);
    }
}
} // namespace

static void bm_quadratic(benchmark::State& state)
{
    auto const n  = static_cast<size_t>(state.range(0));
    auto const x0 = make_random_vector(n);
    run(state, &diagonal_quadratic, x0);
}

static void bm_rosenbrock(benchmark::State& state)
{
    auto const n = static_cast<size_t>(state.range(0));
    std::vector<double> x0(n);
    for (auto i = size_t{0}; i < n; i += 2) {
        x0[i]     = -1.2;
        x0[i + 1] = 1.0;
    }
    run(state, &rosenbrock, x0);
}

BENCHMARK(bm_quadratic)->RangeMultiplier(4)->Range(4, 256);
BENCHMARK(bm_rosenbrock)->RangeMultiplier(4)->Range(4, 256);

BENCHMARK_MAIN();
