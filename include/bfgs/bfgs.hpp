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
#include "line_search.hpp"

#if defined(BFGS_CLANG)
#    pragma clang diagnostic push
#    pragma clang diagnostic ignored "-Wweak-vtables"
#    pragma clang diagnostic ignored "-Wunused-template"
#endif
#include <gsl/gsl-lite.hpp>
#if defined(BFGS_CLANG)
#    pragma clang diagnostic pop
#endif

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring> // std::memcpy
#include <functional>
#include <limits>
#include <memory> // std::addressof
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

/// \file bfgs.hpp
///

BFGS_NAMESPACE_BEGIN

/// Verbosity of the default progress reporting.
enum class display_t {
    silent = 0, ///< No output
    final  = 1, ///< Only the terminal status
    iter   = 2, ///< A table row per iteration and the terminal status
};

/// What to do with a secant update which would destroy positive-definiteness
/// of the curvature matrix.
enum class curvature_t {
    /// Skip the update when `yᵀ·s <= ε·‖y‖₂·‖s‖₂`.
    skip,
    /// Powell's damping: blend `y` with `H·s` so that `yᵀ·s >= 0.2·sᵀ·H·s`.
    damp,
};

struct bfgs_param_t {
    /// Maximum number of BFGS iterations to perform. Zero is allowed and
    /// means that only the starting point is evaluated.
    unsigned max_iter;
    /// Step threshold for the convergence test: `‖xₜ - xₜ₋₁‖_∞ < x_tol`.
    double x_tol;
    /// Value threshold for the convergence test: `|fₜ - fₜ₋₁| < f_tol`.
    double f_tol;
    /// Factor by which the step scale is shrunk during line search.
    ///
    /// \see ls_param_t::backtrack
    double backtrack;
    /// Lower bound for the line search step scale.
    ///
    /// \see ls_param_t::step_min
    double step_min;
    /// Verbosity used by the non-template #minimize overload.
    display_t display;
    /// Safeguard for the secant update.
    curvature_t curvature;

  private:
    explicit constexpr bfgs_param_t(ls_param_t const& ls) noexcept
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        : max_iter{100}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , x_tol{1e-6}
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        , f_tol{1e-6}
        , backtrack{ls.backtrack}
        , step_min{ls.step_min}
        , display{display_t::silent}
        , curvature{curvature_t::skip}
    {}

  public:
    /// Some sane defaults for the parameters.
    constexpr bfgs_param_t() noexcept : bfgs_param_t{ls_param_t{}} {}

    /// Returns the parameters for the backtracking line search.
    [[nodiscard]] constexpr auto line_search() const noexcept -> ls_param_t
    {
        ls_param_t p;
        p.backtrack = backtrack;
        p.step_min  = step_min;
        return p;
    }
};

struct bfgs_result_t {
    status_t status;   ///< Termination status
    unsigned num_iter; ///< Number of iterations
    double   func;     ///< Function value
};

/// Progress information passed to observers after every iteration.
struct iteration_record_t {
    unsigned iteration;      ///< Iteration index (0 for the starting point)
    double   func;           ///< Current function value
    double   func_change;    ///< `fₜ - fₜ₋₁`, NaN for iteration 0
    double   grad_norm;      ///< `‖∇f(xₜ)‖_∞`
    unsigned num_backtracks; ///< Backtracking steps taken in this iteration
    double   step;           ///< Accepted step scale `η` (0 if x didn't move)
    unsigned num_f_evals;    ///< Value-only evaluations so far
    unsigned num_fg_evals;   ///< Value-and-gradient evaluations so far
};

/// \brief Function to be minimised.
///
/// There are two modes of evaluation. Line search trials only need the value
/// and use #value. Accepted points need the gradient as well and use
/// #value_and_gradient. Both must agree exactly at the same point.
class objective_t {
  public:
    objective_t() noexcept                   = default;
    objective_t(objective_t const&) noexcept = default;
    objective_t(objective_t&&) noexcept      = default;
    auto operator=(objective_t const&) noexcept -> objective_t& = default;
    auto operator=(objective_t&&) noexcept -> objective_t& = default;
    virtual ~objective_t() noexcept;

    /// Returns `f(x)`.
    [[nodiscard]] virtual auto value(gsl::span<double const> x) const
        -> double = 0;

    /// Returns `f(x)` and stores `∇f(x)` into \p grad.
    ///
    /// \pre `grad.size() == x.size()`
    virtual auto value_and_gradient(gsl::span<double const> x,
                                    gsl::span<double>       grad) const
        -> double = 0;
};

/// #objective_t built from two function objects.
template <class ValueFn, class ValueAndGradientFn>
class function_objective_t final : public objective_t {
    static_assert(
        std::is_invocable_r_v<double, ValueFn const&, gsl::span<double const>>,
        "`ValueFn` should have a signature `auto (gsl::span<double const>) -> "
        "double`. It must be callable through a const reference.");
    static_assert(
        std::is_invocable_r_v<double, ValueAndGradientFn const&,
                              gsl::span<double const>, gsl::span<double>>,
        "`ValueAndGradientFn` should have a signature `auto "
        "(gsl::span<double const>, gsl::span<double>) -> double`. It must be "
        "callable through a const reference.");

  public:
    function_objective_t(ValueFn value, ValueAndGradientFn value_and_gradient)
        : _value{std::move(value)}
        , _value_and_gradient{std::move(value_and_gradient)}
    {}

    [[nodiscard]] auto value(gsl::span<double const> x) const
        -> double override
    {
        return _value(x);
    }

    auto value_and_gradient(gsl::span<double const> x,
                            gsl::span<double>       grad) const
        -> double override
    {
        return _value_and_gradient(x, grad);
    }

  private:
    ValueFn            _value;
    ValueAndGradientFn _value_and_gradient;
};

template <class ValueFn, class ValueAndGradientFn>
auto make_objective(ValueFn&& value, ValueAndGradientFn&& value_and_gradient)
    -> function_objective_t<std::decay_t<ValueFn>,
                            std::decay_t<ValueAndGradientFn>>
{
    return {std::forward<ValueFn>(value),
            std::forward<ValueAndGradientFn>(value_and_gradient)};
}

/// Observer which ignores everything.
struct no_observer_t {
    constexpr auto on_iteration(iteration_record_t const& /*unused*/) const
        noexcept -> void
    {}
    constexpr auto on_exit(bfgs_result_t const& /*unused*/) const noexcept
        -> void
    {}
};

/// \brief Observer which prints a progress table.
///
/// With #display_t::iter a header and one row per iteration are printed. With
/// #display_t::final or #display_t::iter the terminal status is printed.
class progress_printer_t {
  public:
    explicit progress_printer_t(display_t display,
                                std::FILE* stream = stdout) noexcept;

    auto on_iteration(iteration_record_t const& record) const -> void;
    auto on_exit(bfgs_result_t const& result) const -> void;

  private:
    display_t  _display;
    std::FILE* _stream;
};

namespace detail {
auto dot(gsl::span<double const> a, gsl::span<double const> b) noexcept
    -> double;
auto nrm2(gsl::span<double const> x) noexcept -> double;
/// Returns `max |xᵢ|` (0 for empty spans, NaN if any `xᵢ` is NaN).
auto norm_inf(gsl::span<double const> x) noexcept -> double;
auto axpy(double a, gsl::span<double const> x, gsl::span<double> y) noexcept
    -> void;
/// `out <- a * x + y`
auto axpy(double a, gsl::span<double const> x, gsl::span<double const> y,
          gsl::span<double> out) noexcept -> void;
auto scal(double a, gsl::span<double> x) noexcept -> void;

/// Checks \p p for validity.
constexpr auto check_parameters(bfgs_param_t const& p) noexcept -> status_t
{
    if (std::isnan(p.x_tol) || p.x_tol <= 0.0) {
        return status_t::invalid_x_tolerance;
    }
    if (std::isnan(p.f_tol) || p.f_tol <= 0.0) {
        return status_t::invalid_function_tolerance;
    }
    if (p.display != display_t::silent && p.display != display_t::final
        && p.display != display_t::iter) {
        return status_t::invalid_argument;
    }
    if (p.curvature != curvature_t::skip && p.curvature != curvature_t::damp) {
        return status_t::invalid_argument;
    }
    return check_parameters(p.line_search());
}

template <class T>
BFGS_FORCEINLINE constexpr auto as_const(T& x) noexcept -> T const&
{
    return x;
}

/// Returns whether \p f holds no callable target.
template <class T> constexpr auto is_empty(T const& /*unused*/) noexcept -> bool
{
    return false;
}

template <class R, class... Args>
auto is_empty(std::function<R(Args...)> const& f) noexcept -> bool
{
    return !static_cast<bool>(f);
}

template <class R, class... Args>
constexpr auto is_empty(R (*f)(Args...)) noexcept -> bool
{
    return f == nullptr;
}

/// \brief Point
struct bfgs_point_t {
  private:
    double _value;           ///< Function value at #optim::bfgs::bfgs_point_t::x
    gsl::span<double> _x;    ///< Point in parameter space.
    gsl::span<double> _grad; ///< Function gradient at `_x`.

    mutable double _grad_norm; ///< L_∞ norm of `_grad`. It should be treated
        ///< as an optional value with NaN representing `nullopt`.
        ///< Prefer to use #grad_norm() member function instead

  public:
    constexpr bfgs_point_t(double const value, gsl::span<double> const x,
                           gsl::span<double> const grad) noexcept
        : _value{value}
        , _x{x}
        , _grad{grad}
        , _grad_norm{std::numeric_limits<double>::quiet_NaN()}
    {
        BFGS_ASSERT(
            x.size() == grad.size(),
            "size of the gradient must be equal to the number of variables");
        BFGS_ASSERT(x.size() > 0,
                    "there must be at least one variable to optimise");
    }

    bfgs_point_t(bfgs_point_t const& other) = delete;
    bfgs_point_t(bfgs_point_t&&)            = delete;

    auto operator=(bfgs_point_t const& other) noexcept -> bfgs_point_t&
    {
        BFGS_ASSERT(_x.size() == other._x.size(), "incompatible sizes");
        BFGS_ASSERT(_grad.size() == other._grad.size(), "incompatible sizes");

        if (BFGS_UNLIKELY(this == std::addressof(other))) { return *this; }
        _value     = other._value;
        _grad_norm = other._grad_norm;
        std::memcpy(_x.data(), other._x.data(), _x.size() * sizeof(double));
        std::memcpy(_grad.data(), other._grad.data(),
                    _grad.size() * sizeof(double));
        return *this;
    }

    constexpr auto value() const noexcept -> double { return _value; }
    constexpr auto value() noexcept -> double& { return _value; }

    constexpr auto x() const noexcept -> gsl::span<double const> { return _x; }
    constexpr auto x() noexcept -> gsl::span<double> { return _x; }

    constexpr auto grad() const noexcept -> gsl::span<double const>
    {
        return _grad;
    }
    constexpr auto grad() noexcept -> gsl::span<double>
    {
        _grad_norm = std::numeric_limits<double>::quiet_NaN();
        return _grad;
    }

    auto grad_norm() const noexcept -> double
    {
        if (std::isnan(_grad_norm)) { _grad_norm = detail::norm_inf(_grad); }
        return _grad_norm;
    }
};

struct bfgs_state_t {
    bfgs_point_t      current;
    bfgs_point_t      previous;
    gsl::span<double> direction; ///< `p` such that `H·p = ∇f`
    gsl::span<double> s;         ///< `xₜ - xₜ₋₁`
    gsl::span<double> y;         ///< `∇f(xₜ) - ∇f(xₜ₋₁)`
    gsl::span<double> hessian_s; ///< `H·s`
    gsl::span<double> hessian;   ///< `H`, row-major `n×n`
};

/// Sets \p hessian (row-major `n×n`) to the identity matrix.
auto set_identity(gsl::span<double> hessian) noexcept -> void;

/// \brief Solves `H·p = g` using Cholesky factorisation of `H`.
///
/// \return `false` if `H` is not numerically positive-definite. \p direction
///         is left unspecified in that case.
auto solve_direction(gsl::span<double const> hessian,
                     gsl::span<double const> grad, gsl::span<double> direction)
    -> bool;

/// \brief Applies the BFGS secant update to the Hessian approximation
///
///     H <- H + (y·yᵀ)/(yᵀ·s) - (H·s)·(H·s)ᵀ/(sᵀ·H·s)
///
/// \p y may be overwritten (damped) and \p hessian_s receives `H·s`.
///
/// \return whether the update was applied.
auto secant_update(gsl::span<double> hessian, gsl::span<double const> s,
                   gsl::span<double> y, gsl::span<double> hessian_s,
                   curvature_t policy) noexcept -> bool;
} // namespace detail

/// Scratch memory for one run of the solver.
class bfgs_buffers_t {
  public:
    bfgs_buffers_t() noexcept;
    explicit bfgs_buffers_t(size_t n);

    bfgs_buffers_t(bfgs_buffers_t const&) = delete;
    bfgs_buffers_t(bfgs_buffers_t&&) noexcept;
    auto operator=(bfgs_buffers_t const&) -> bfgs_buffers_t& = delete;
    auto operator=(bfgs_buffers_t&&) noexcept -> bfgs_buffers_t&;
    ~bfgs_buffers_t() noexcept;

    auto resize(size_t n) -> void;
    auto make_state() noexcept -> detail::bfgs_state_t;

  private:
    auto get(size_t i) noexcept -> gsl::span<double>;

    std::vector<double> _workspace;
    size_t              _n;
};

namespace detail {
struct line_search_runner_fn {

    line_search_runner_fn(bfgs_state_t&       state,
                          bfgs_param_t const& params) noexcept
        : _state{state}, _params{params.line_search()}
    {}

    line_search_runner_fn(line_search_runner_fn const&) = delete;
    line_search_runner_fn(line_search_runner_fn&&)      = delete;
    auto operator                 =(line_search_runner_fn const&)
        -> line_search_runner_fn& = delete;
    auto operator=(line_search_runner_fn &&) -> line_search_runner_fn& = delete;

  private:
    struct wrapper_t {
        objective_t const&      objective;
        gsl::span<double>       x;
        gsl::span<double>       grad;
        gsl::span<double const> x_0;
        gsl::span<double const> direction;

        auto operator()(double const eta,
                        std::false_type /*compute gradient*/) const -> double
        {
            detail::axpy(-eta, direction, x_0, x);
            return objective.value(x);
        }

        auto operator()(double const eta,
                        std::true_type /*compute gradient*/) const -> double
        {
            detail::axpy(-eta, direction, x_0, x);
            return objective.value_and_gradient(x, grad);
        }
    };

  public:
    /// \brief Moves `_state.current` along `-direction`.
    ///
    /// `_state.previous` must hold the starting point. On success
    /// `_state.current` holds the accepted point together with its gradient.
    /// Otherwise it is reset to `_state.previous`.
    auto operator()(objective_t const& objective) -> ls_result_t
    {
        auto const func_0 = _state.previous.value();
        BFGS_TRACE("<line_search_runner::operator()>\nf(x_0) = %.10e\n",
                   func_0);
        auto wrapper = wrapper_t{objective, _state.current.x(),
                                 _state.current.grad(),
                                 as_const(_state.previous).x(),
                                 as_const(_state.direction)};
        auto const result = line_search(wrapper, _params.at_zero(func_0));
        if (result.status != status_t::success) {
            // None of the trials improved the loss function, so we undo them
            _state.current = _state.previous;
        }
        else if (result.cached) {
            _state.current.value() = result.func;
        }
        else {
            // `x` already holds the accepted point, but the gradient belongs
            // to the rejected full step.
            _state.current.value() = objective.value_and_gradient(
                as_const(_state.current).x(), _state.current.grad());
        }
        BFGS_TRACE("</line_search_runner::operator()>\nf(x) = %.10e, η = %.5e, "
                   "backtracks = %u\n",
                   _state.current.value(), result.step, result.num_backtracks);
        return result;
    }

  private:
    bfgs_state_t& _state;
    ls_param_t    _params;
};

/// \brief Checks whether both the value change and the step are small enough.
///
/// We perform the following check: `|fₜ - fₜ₋₁| < f_tol` and
/// `‖xₜ - xₜ₋₁‖_∞ < x_tol`. `state.s` must already hold `xₜ - xₜ₋₁`.
struct converged_fn {
    bfgs_state_t const& state;
    bfgs_param_t const& params;

    auto operator()() const noexcept -> bool
    {
        auto const func_change =
            std::abs(state.current.value() - state.previous.value());
        auto const step_norm = detail::norm_inf(state.s);
        auto const result =
            func_change < params.f_tol && step_norm < params.x_tol;
        BFGS_TRACE("converged? |Δf| = %.10e < %.10e && ‖Δx‖ = %.10e < %.10e? "
                   "-> %i\n",
                   func_change, params.f_tol, step_norm, params.x_tol, result);
        return result;
    }
};

/// \brief Runs the BFGS iterations on \p state.
///
/// `state.current.x()` must hold the starting point and `state.hessian` the
/// initial curvature matrix (see #set_identity).
template <class Observer>
auto minimize(objective_t const& objective, bfgs_param_t const& params,
              bfgs_state_t& state, Observer&& observer) -> bfgs_result_t
{
    constexpr auto NaN = std::numeric_limits<double>::quiet_NaN();
    state.current.value() = objective.value_and_gradient(
        as_const(state.current).x(), state.current.grad());

    auto num_f_evals  = 0U;
    auto num_fg_evals = 1U;
    observer.on_iteration(iteration_record_t{0, state.current.value(), NaN,
                                             state.current.grad_norm(), 0, 0.0,
                                             num_f_evals, num_fg_evals});

    line_search_runner_fn do_line_search{state, params};
    converged_fn          has_converged{state, params};

    auto status    = status_t::not_converged;
    auto iteration = 0U;
    while (status == status_t::not_converged && iteration < params.max_iter) {
        ++iteration;
        state.previous = state.current;

        auto num_backtracks = 0U;
        auto step           = 0.0;
        if (!solve_direction(state.hessian, as_const(state.current).grad(),
                             state.direction)) {
            BFGS_TRACE("iteration %u: curvature matrix is not positive-definite\n",
                       iteration);
            status = status_t::rounding_errors_prevent_progress;
        }
        else if (!std::all_of(state.direction.begin(), state.direction.end(),
                              [](auto const p) { return std::isfinite(p); })) {
            // Non-finite gradient at the current point: the oracle must not
            // be queried along this direction.
            BFGS_TRACE("iteration %u: non-finite search direction\n",
                       iteration);
            status = status_t::step_underflow;
        }
        else if (std::all_of(state.direction.begin(), state.direction.end(),
                             [](auto const p) { return p == 0.0; })) {
            // The gradient vanished: take the null step.
            BFGS_TRACE("iteration %u: zero search direction\n", iteration);
        }
        else {
            auto const r = do_line_search(objective);
            num_backtracks = r.num_backtracks;
            num_f_evals += r.num_backtracks;
            num_fg_evals += 1U;
            if (r.status == status_t::success) {
                step = r.step;
                if (!r.cached) { num_fg_evals += 1U; }
            }
            else {
                status = r.status;
            }
        }

        if (status == status_t::not_converged) {
            detail::axpy(-1.0, as_const(state.previous).x(),
                         as_const(state.current).x(), state.s);
            detail::axpy(-1.0, as_const(state.previous).grad(),
                         as_const(state.current).grad(), state.y);
            if (!secant_update(state.hessian, state.s, state.y,
                               state.hessian_s, params.curvature)) {
                BFGS_TRACE("iteration %u: secant update skipped\n", iteration);
            }
            if (has_converged()) { status = status_t::converged; }
        }

        observer.on_iteration(iteration_record_t{
            iteration, state.current.value(),
            state.current.value() - state.previous.value(),
            state.current.grad_norm(), num_backtracks, step, num_f_evals,
            num_fg_evals});
    }

    auto const result = bfgs_result_t{status, iteration, state.current.value()};
    BFGS_TRACE("terminated with status %i after %u iterations\n",
               static_cast<int>(status), iteration);
    observer.on_exit(result);
    return result;
}
} // namespace detail

/// \brief Minimises \p objective starting at \p x.
///
/// \p x is overwritten with the final point. \p observer must provide
/// `on_iteration(iteration_record_t const&)` and `on_exit(bfgs_result_t
/// const&)`.
template <class Observer>
auto minimize(objective_t const& objective, bfgs_param_t const& params,
              gsl::span<double> x, Observer&& observer) -> bfgs_result_t
{
    if (auto status = detail::check_parameters(params);
        BFGS_UNLIKELY(status != status_t::success)) {
        return {status, 0, std::numeric_limits<double>::quiet_NaN()};
    }
    if (BFGS_UNLIKELY(x.empty())) {
        return {status_t::invalid_argument, 0,
                std::numeric_limits<double>::quiet_NaN()};
    }
    bfgs_buffers_t buffers(x.size());
    auto           state = buffers.make_state();
    std::memcpy(state.current.x().data(), x.data(), x.size() * sizeof(double));
    detail::set_identity(state.hessian);
    auto const result = detail::minimize(objective, params, state, observer);
    std::memcpy(x.data(), detail::as_const(state.current).x().data(),
                x.size() * sizeof(double));
    return result;
}

/// \brief Minimises \p objective starting at \p x reporting progress according
/// to `params.display`.
auto minimize(objective_t const& objective, bfgs_param_t const& params,
              gsl::span<double> x) -> bfgs_result_t;

/// Minimises \p objective starting at \p x with default parameters.
inline auto minimize(objective_t const& objective, gsl::span<double> x)
    -> bfgs_result_t
{
    return minimize(objective, bfgs_param_t{}, x);
}

/// \brief Minimises a function given by two callables.
///
/// \p value should have a signature `auto (gsl::span<double const>) -> double`
/// and \p value_and_gradient `auto (gsl::span<double const>,
/// gsl::span<double>) -> double`. Null function pointers and empty
/// `std::function`s are rejected with #status_t::invalid_argument.
template <class ValueFn, class ValueAndGradientFn>
auto minimize(ValueFn value, ValueAndGradientFn value_and_gradient,
              bfgs_param_t const& params, gsl::span<double> x)
    -> bfgs_result_t
{
    if (detail::is_empty(value) || detail::is_empty(value_and_gradient)) {
        return {status_t::invalid_argument, 0,
                std::numeric_limits<double>::quiet_NaN()};
    }
    auto const objective =
        make_objective(std::move(value), std::move(value_and_gradient));
    return minimize(static_cast<objective_t const&>(objective), params, x);
}

/// #status_t can be used with `std::error_code`.
auto make_error_code(status_t) noexcept -> std::error_code;

BFGS_NAMESPACE_END

namespace std {
/// Make `status_t` act as an error code.
template <>
struct is_error_code_enum<::BFGS_NAMESPACE::status_t> : false_type {};
} // namespace std
