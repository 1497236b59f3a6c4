// Copyright (c) 2019, Tom Westerhout
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// * Redistributions of source code must retain the above copyright notice, this
//   list of conditions and the following disclaimer.
//
// * Redistributions in binary form must reproduce the above copyright notice,
//   this list of conditions and the following disclaimer in the documentation
//   and/or other materials provided with the distribution.
//
// * Neither the name of the copyright holder nor the names of its
//   contributors may be used to endorse or promote products derived from
//   this software without specific prior written permission.
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

#include <cmath>
#include <limits>
#include <type_traits>

/// \file line_search.hpp
///
/// Backtracking line search along a fixed search direction.

BFGS_NAMESPACE_BEGIN

// ========================== Public Interface ============================= {{{

/// Parameters for the backtracking line search.
struct ls_param_t {
    /// \brief Shrink factor applied to the step scale after every rejected
    /// trial.
    ///
    /// \pre `0 < backtrack && backtrack < 1`
    double backtrack;
    /// \brief Lower bound for the step scale `η`.
    ///
    /// The search gives up once `η` drops to or below this value.
    ///
    /// \pre `0 < step_min && step_min < 1`
    double step_min;
    /// Function value at `η = 0` (i.e. `ф(0)`)
    double func_0;

    /// Some sane defaults for the backtracking line search.
    constexpr ls_param_t() noexcept
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        : backtrack{0.5}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , step_min{1e-12}
        , func_0{std::numeric_limits<double>::quiet_NaN()}
    {}

    /// A convenience function for setting the initial state.
    ///
    /// A common use case is to pass `ls_param_t{}.at_zero(my_value)` to the
    /// line search algorithm.
    constexpr auto at_zero(double const func) noexcept -> ls_param_t&
    {
        func_0 = func;
        return *this;
    }
};

struct ls_result_t {
    status_t status;         ///< Either `success` or `step_underflow`
    double   step;           ///< Accepted step scale `η` (0 on failure)
    double   func;           ///< Function value at #step: `ф(η)`
    unsigned num_backtracks; ///< Number of times `η` was shrunk
    unsigned num_f_evals;    ///< Number of function evaluations
    /// Whether the last evaluation was done at #step *with* the gradient. If
    /// `cached == true`, the gradient computed during the search can be reused;
    /// otherwise the caller has to recompute it.
    bool cached;
};

/// \brief Runs the backtracking line search.
///
/// \p phi is the restriction of the objective to the search direction. It is
/// called as `phi(η, std::true_type{})` when the gradient at the trial point
/// is wanted as well, and as `phi(η, std::false_type{})` when only the value
/// is needed. Both return `ф(η)`.
///
/// The full step `η = 1` is tried first (with gradient). If it does not
/// decrease the function, `η` is multiplied by `params.backtrack` until
/// `ф(η) < ф(0)` or `η <= params.step_min`. Shrunk trials are evaluated
/// without gradient.
template <class Function>
auto line_search(Function&& phi, ls_param_t const& params) -> ls_result_t;

// ========================== Public Interface ============================= }}}

namespace detail {

/// \brief Checks the user-provided parameters for sanity.
///
/// If no problems with the input parameters can be found, #status_t::success is
/// returned. Otherwise, the #status_t returned indicated the error.
constexpr auto check_parameters(ls_param_t const& p) noexcept -> status_t
{
    if (std::isnan(p.backtrack) || p.backtrack <= 0.0 || p.backtrack >= 1.0) {
        return status_t::invalid_backtrack_factor;
    }
    if (std::isnan(p.step_min) || p.step_min <= 0.0 || p.step_min >= 1.0) {
        return status_t::invalid_step_bounds;
    }
    return status_t::success;
}

template <class Function> struct evaluate_fn {
    Function& phi;
    unsigned& num_f_evals;

    template <bool WithGradient>
    auto operator()(double const step,
                    std::integral_constant<bool, WithGradient> tag) const
        -> double
    {
        // Yes, we want implicit conversion to double here!
        double const func = phi(step, tag);
        ++num_f_evals;
        BFGS_TRACE("trial η=%.5e: ф(η)=%.10e (gradient: %i)\n", step, func,
                   static_cast<int>(WithGradient));
        return func;
    }
};

template <class Function>
evaluate_fn(Function&, unsigned&)->evaluate_fn<Function>;

} // namespace detail

template <class Function>
auto line_search(Function&& phi, ls_param_t const& params) -> ls_result_t
{
    static_assert(
        std::is_invocable_r_v<double, Function&, double, std::true_type>
            && std::is_invocable_r_v<double, Function&, double,
                                     std::false_type>,
        "`Function` should have signatures `auto (double, std::true_type) -> "
        "double` and `auto (double, std::false_type) -> double`.");
    BFGS_ASSERT(detail::check_parameters(params) == status_t::success,
                "invalid parameters");

    auto                num_f_evals = 0U;
    detail::evaluate_fn evaluate{phi, num_f_evals};

    auto step = 1.0;
    auto func = evaluate(step, std::true_type{});
    if (func < params.func_0) {
        return {status_t::success, step, func, 0, num_f_evals, true};
    }

    auto num_backtracks = 0U;
    // NOTE: `func >= func_0` is false for NaN, so a non-finite trial ends the
    // search right away.
    while (func >= params.func_0 && step > params.step_min) {
        ++num_backtracks;
        step *= params.backtrack;
        func = evaluate(step, std::false_type{});
    }
    if (func < params.func_0) {
        return {status_t::success, step, func, num_backtracks, num_f_evals,
                false};
    }
    BFGS_TRACE("step underflow after %u backtracks: η=%.5e\n", num_backtracks,
               step);
    return {status_t::step_underflow, 0.0, params.func_0, num_backtracks,
            num_f_evals, false};
}

BFGS_NAMESPACE_END
