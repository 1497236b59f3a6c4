#include "bfgs/bfgs.hpp"
#include <iostream>
#include <vector>

int main()
{
    constexpr size_t N = 10;
    static_assert(N % 2 == 0);
    std::vector<double> x0(N);

    for (auto i = size_t{0}; i < N; i += 2) {
        x0[i]     = -1.2;
        x0[i + 1] = 1.0;
    }

    auto const value_and_gradient = [](auto const x, auto const grad) {
        auto f_x = 0.0;
        for (auto i = size_t{0}; i < x.size(); i += 2) {
            auto const a  = x[i];
            auto const b  = x[i + 1];
            auto const t1 = 1.0 - a;
            auto const t2 = 10.0 * (b - a * a);
            grad[i + 1]   = 20.0 * t2;
            grad[i]       = -2.0 * (20.0 * a * t2 + t1);
            f_x += t1 * t1 + t2 * t2;
        }
        return f_x;
    };
    auto const value = [&value_and_gradient](auto const x) {
        std::vector<double> grad(x.size());
        return value_and_gradient(x, gsl::span<double>{grad});
    };

    optim::bfgs::bfgs_param_t params;
    params.max_iter = 500;
    params.display  = optim::bfgs::display_t::iter;
    auto const result =
        optim::bfgs::minimize(value, value_and_gradient, params, {x0});

    std::cerr << result.func << '\n';
    return result.status == optim::bfgs::status_t::not_converged ? 1 : 0;
}
