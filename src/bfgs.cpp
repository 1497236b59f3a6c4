// vim: foldenable foldmethod=marker
#include "bfgs/bfgs.hpp"

#include <cblas.h>

#if defined(BFGS_CLANG)
#    pragma clang diagnostic push
#    pragma clang diagnostic ignored "-Wextra-semi"
#    pragma clang diagnostic ignored "-Wshadow"
#endif
#include <Eigen/Cholesky>
#include <Eigen/Core>
#if defined(BFGS_CLANG)
#    pragma clang diagnostic pop
#endif

#include <exception>
#include <stdexcept>
#include <string>

BFGS_NAMESPACE_BEGIN

// ============================= Error codes =============================== {{{
namespace { // anonymous namespace
struct bfgs_error_category : public std::error_category {
    constexpr bfgs_error_category() noexcept = default;

    bfgs_error_category(bfgs_error_category const&) = delete;
    bfgs_error_category(bfgs_error_category&&)      = delete;
    auto operator               =(bfgs_error_category const&)
        -> bfgs_error_category& = delete;
    auto operator=(bfgs_error_category &&) -> bfgs_error_category& = delete;

    ~bfgs_error_category() override = default;

    [[nodiscard]] auto        name() const noexcept -> char const* override;
    [[nodiscard]] auto        message(int value) const -> std::string override;
    [[nodiscard]] static auto instance() noexcept -> std::error_category const&;
};

auto bfgs_error_category::name() const noexcept -> char const*
{
    return "bfgs category";
}

auto bfgs_error_category::message(int const value) const -> std::string
{
    switch (static_cast<status_t>(value)) {
    case status_t::not_converged:
        return "maximum number of iterations reached";
    case status_t::converged: return "converged";
    case status_t::step_underflow:
        return "line search step scale dropped below ηₘᵢₙ";
    case status_t::success: return "no error";
    case status_t::invalid_argument: return "received an invalid argument";
    case status_t::invalid_x_tolerance: return "invalid step tolerance";
    case status_t::invalid_function_tolerance:
        return "invalid function value tolerance";
    case status_t::invalid_backtrack_factor:
        return "invalid backtracking factor";
    case status_t::invalid_step_bounds: return "invalid lower bound ηₘᵢₙ";
    case status_t::rounding_errors_prevent_progress:
        return "rounding errors prevent further progress";
#if defined(BFGS_CLANG)
#    pragma clang diagnostic push
#    pragma clang diagnostic ignored "-Wcovered-switch-default"
#endif
    // NOTE: We do want the default case, because the user could have constructed an
    // invalid error code using our category
    // NOLINTNEXTLINE
    default: return "(unrecognised error)";
#if defined(BFGS_CLANG)
#    pragma clang diagnostic pop
#endif
    } // end switch
}

auto bfgs_error_category::instance() noexcept -> std::error_category const&
{
#if defined(BFGS_CLANG)
#    pragma clang diagnostic push
#    pragma clang diagnostic ignored "-Wexit-time-destructors"
#endif
    static bfgs_error_category c; // NOLINT
#if defined(BFGS_CLANG)
#    pragma clang diagnostic pop
#endif
    return c;
}
} // namespace

BFGS_EXPORT auto make_error_code(status_t const e) noexcept -> std::error_code
{
    return {static_cast<int>(e), bfgs_error_category::instance()};
}
// ============================= Error codes =============================== }}}

namespace detail {

[[noreturn]] BFGS_EXPORT auto assert_fail(char const* expr, char const* file,
                                          unsigned line, char const* function,
                                          char const* msg) noexcept -> void
{
    // NOLINTNEXTLINE
    std::fprintf(stderr,
                 BFGS_BUG_MESSAGE
                 "\n\x1b[1m\x1b[91mAssertion failed\x1b[0m at %s:%u: %s: "
                 "\"\x1b[1m\x1b[97m%s\x1b[0m\" evaluated to false: "
                 "\x1b[1m\x1b[97m%s\x1b[0m\n",
                 file, line, function, expr, msg);
    std::terminate();
}

// ================================= BLAS ================================== {{{
// A hacky way of determining the integral type BLAS uses for sizes and
// increments: we pattern match on the signature of `cblas_ddot`.
template <class T> struct get_blas_int_type;

template <class T>
struct get_blas_int_type<double (*)(T, double const*, T, double const*, T)> {
    using type = T;
};

using blas_int = typename get_blas_int_type<decltype(&cblas_ddot)>::type;

BFGS_EXPORT auto dot(gsl::span<double const> a,
                     gsl::span<double const> b) noexcept -> double
{
    BFGS_ASSERT(a.size() == b.size(), "incompatible dimensions");
    BFGS_ASSERT(
        a.size() <= static_cast<size_t>(std::numeric_limits<blas_int>::max()),
        "integer overflow");
    return cblas_ddot(static_cast<blas_int>(a.size()), a.data(), 1, b.data(),
                      1);
}

BFGS_EXPORT auto nrm2(gsl::span<double const> x) noexcept -> double
{
    BFGS_ASSERT(
        x.size() <= static_cast<size_t>(std::numeric_limits<blas_int>::max()),
        "integer overflow");
    return cblas_dnrm2(static_cast<blas_int>(x.size()), x.data(), 1);
}

BFGS_EXPORT auto norm_inf(gsl::span<double const> x) noexcept -> double
{
    BFGS_ASSERT(
        x.size() <= static_cast<size_t>(std::numeric_limits<blas_int>::max()),
        "integer overflow");
    if (x.empty()) { return 0.0; }
    // idamax may skip over NaNs
    if (std::any_of(x.begin(), x.end(),
                    [](auto const a) { return std::isnan(a); })) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    auto const i = cblas_idamax(static_cast<blas_int>(x.size()), x.data(), 1);
    return std::abs(x[static_cast<size_t>(i)]);
}

BFGS_EXPORT auto scal(double const a, gsl::span<double> x) noexcept -> void
{
    BFGS_ASSERT(
        x.size() <= static_cast<size_t>(std::numeric_limits<blas_int>::max()),
        "integer overflow");
    cblas_dscal(static_cast<blas_int>(x.size()), a, x.data(), 1);
}

BFGS_EXPORT auto axpy(double const a, gsl::span<double const> x,
                      gsl::span<double> y) noexcept -> void
{
    BFGS_ASSERT(x.size() == y.size(), "incompatible dimensions");
    BFGS_ASSERT(
        x.size() <= static_cast<size_t>(std::numeric_limits<blas_int>::max()),
        "integer overflow");
    cblas_daxpy(static_cast<blas_int>(x.size()), a, x.data(), 1, y.data(), 1);
}

BFGS_EXPORT auto axpy(double const a, gsl::span<double const> x,
                      gsl::span<double const> y,
                      gsl::span<double>       out) noexcept -> void
{
    BFGS_ASSERT(x.size() == y.size() && y.size() == out.size(),
                "incompatible dimensions");
    std::memcpy(out.data(), y.data(), out.size() * sizeof(double));
    axpy(a, x, out);
}

namespace {
    /// `out <- A·x` for a square row-major `A`.
    auto gemv(gsl::span<double const> a, gsl::span<double const> x,
              gsl::span<double> out) noexcept -> void
    {
        BFGS_ASSERT(a.size() == x.size() * x.size(), "incompatible dimensions");
        BFGS_ASSERT(x.size() == out.size(), "incompatible dimensions");
        auto const n = static_cast<blas_int>(x.size());
        cblas_dgemv(CblasRowMajor, CblasNoTrans, n, n, 1.0, a.data(), n,
                    x.data(), 1, 0.0, out.data(), 1);
    }

    /// `A <- A + α·x·xᵀ` for a square row-major `A`.
    auto ger(double const alpha, gsl::span<double const> x,
             gsl::span<double> a) noexcept -> void
    {
        BFGS_ASSERT(a.size() == x.size() * x.size(), "incompatible dimensions");
        auto const n = static_cast<blas_int>(x.size());
        cblas_dger(CblasRowMajor, n, n, alpha, x.data(), 1, x.data(), 1,
                   a.data(), n);
    }
} // namespace
// ================================= BLAS ================================== }}}

// ============================ Curvature matrix =========================== {{{
BFGS_EXPORT auto set_identity(gsl::span<double> const hessian) noexcept -> void
{
    auto const n = static_cast<size_t>(
        std::lround(std::sqrt(static_cast<double>(hessian.size()))));
    BFGS_ASSERT(n * n == hessian.size(), "matrix must be square");
    std::fill(hessian.begin(), hessian.end(), 0.0);
    for (auto i = size_t{0}; i < n; ++i) {
        hessian[i * n + i] = 1.0;
    }
}

BFGS_EXPORT auto solve_direction(gsl::span<double const> const hessian,
                                 gsl::span<double const> const grad,
                                 gsl::span<double> const       direction)
    -> bool
{
    BFGS_ASSERT(grad.size() == direction.size(), "incompatible dimensions");
    BFGS_ASSERT(hessian.size() == grad.size() * grad.size(),
                "incompatible dimensions");
    using row_major_matrix_t =
        Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
    auto const n = static_cast<Eigen::Index>(grad.size());
    Eigen::Map<row_major_matrix_t const> const h{hessian.data(), n, n};
    Eigen::LLT<Eigen::MatrixXd> const          llt{h};
    if (llt.info() != Eigen::Success) {
        BFGS_TRACE("%s", "Cholesky factorisation of H failed\n");
        return false;
    }
    Eigen::Map<Eigen::VectorXd>{direction.data(), n} =
        llt.solve(Eigen::Map<Eigen::VectorXd const>{grad.data(), n});
    return true;
}

BFGS_EXPORT auto secant_update(gsl::span<double> const       hessian,
                               gsl::span<double const> const s,
                               gsl::span<double> const       y,
                               gsl::span<double> const       hessian_s,
                               curvature_t const policy) noexcept -> bool
{
    constexpr auto epsilon = std::numeric_limits<double>::epsilon();
    gemv(hessian, s, hessian_s);
    auto const s_hessian_s = dot(s, hessian_s);
    auto       s_dot_y     = dot(s, y);
    // Negated comparisons so that NaNs end up here as well
    if (!(s_hessian_s > 0.0)) {
        BFGS_TRACE("sᵀ·H·s = %.10e, skipping update\n", s_hessian_s);
        return false;
    }

    switch (policy) {
    case curvature_t::skip:
        if (!(s_dot_y > epsilon * nrm2(s) * nrm2(y))) {
            BFGS_TRACE("yᵀ·s = %.10e violates the curvature condition, "
                       "skipping update\n",
                       s_dot_y);
            return false;
        }
        break;
    case curvature_t::damp:
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        if (s_dot_y < 0.2 * s_hessian_s) {
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
            auto const theta = 0.8 * s_hessian_s / (s_hessian_s - s_dot_y);
            scal(theta, y);
            axpy(1.0 - theta, hessian_s, y);
            s_dot_y = theta * s_dot_y + (1.0 - theta) * s_hessian_s;
            BFGS_TRACE("damped update: θ = %.10e, yᵀ·s = %.10e\n", theta,
                       s_dot_y);
        }
        if (!(s_dot_y >= epsilon)) { return false; }
        break;
    } // end switch

    ger(1.0 / s_dot_y, y, hessian);
    ger(-1.0 / s_hessian_s, hessian_s, hessian);
    return true;
}
// ============================ Curvature matrix =========================== }}}

} // namespace detail

// =============================== Objective =============================== {{{
BFGS_EXPORT objective_t::~objective_t() noexcept = default;
// =============================== Objective =============================== }}}

// =============================== Buffers ================================= {{{
namespace {
constexpr auto number_vectors = size_t{1}  /* x */
                                + 1        /* grad */
                                + 1        /* x_prev */
                                + 1        /* grad_prev */
                                + 1        /* direction */
                                + 1        /* s */
                                + 1        /* y */
                                + 1;       /* H·s */
} // namespace

BFGS_EXPORT bfgs_buffers_t::bfgs_buffers_t() noexcept : _workspace{}, _n{0} {}

BFGS_EXPORT bfgs_buffers_t::bfgs_buffers_t(size_t const n)
    : _workspace{}, _n{0}
{
    resize(n);
}

BFGS_EXPORT
bfgs_buffers_t::bfgs_buffers_t(bfgs_buffers_t&&) noexcept = default;
BFGS_EXPORT auto bfgs_buffers_t::operator=(bfgs_buffers_t&&) noexcept
    -> bfgs_buffers_t& = default;
BFGS_EXPORT bfgs_buffers_t::~bfgs_buffers_t() noexcept = default;

BFGS_EXPORT auto bfgs_buffers_t::resize(size_t const n) -> void
{
    if (n == _n) { return; }
    // n vectors for the Hessian approximation on top of the others
    auto const max_size = std::numeric_limits<size_t>::max() / sizeof(double);
    if (n != 0 && n + number_vectors > max_size / n) {
        throw std::overflow_error{
            "integer overflow in bfgs_buffers_t::resize(size_t)"};
    }
    _workspace.clear();
    _workspace.resize(n * (n + number_vectors), 0.0);
    _n = n;
}

BFGS_EXPORT auto bfgs_buffers_t::make_state() noexcept -> detail::bfgs_state_t
{
    constexpr auto NaN = std::numeric_limits<double>::quiet_NaN();
    return detail::bfgs_state_t{
        {NaN, get(0), get(1)},
        {NaN, get(2), get(3)},
        get(4),
        get(5),
        get(6),
        get(7),
        gsl::span<double>{_workspace.data() + number_vectors * _n, _n * _n}};
}

auto bfgs_buffers_t::get(size_t const i) noexcept -> gsl::span<double>
{
    BFGS_ASSERT(i < number_vectors, "index out of bounds");
    return {_workspace.data() + i * _n, _n};
}
// =============================== Buffers ================================= }}}

// =========================== Progress printer ============================ {{{
BFGS_EXPORT progress_printer_t::progress_printer_t(display_t const  display,
                                                   std::FILE* const stream) noexcept
    : _display{display}, _stream{stream}
{}

BFGS_EXPORT auto
progress_printer_t::on_iteration(iteration_record_t const& record) const
    -> void
{
    if (_display != display_t::iter) { return; }
    if (record.iteration == 0) {
        // NOLINTNEXTLINE
        std::fprintf(_stream, "%7s  %15s  %15s  %15s  %10s\n", "Iters", "Fval",
                     "Fval.ch", "1st-ord norm", "backtracks");
    }
    // NOLINTNEXTLINE
    std::fprintf(_stream, "%7u  %15.6g  %15.6g  %15.6g  %10u\n",
                 record.iteration, record.func, record.func_change,
                 record.grad_norm, record.num_backtracks);
}

BFGS_EXPORT auto progress_printer_t::on_exit(bfgs_result_t const& result) const
    -> void
{
    if (_display == display_t::silent) { return; }
    // NOLINTNEXTLINE
    std::fprintf(_stream, "bfgs terminated with status %i (%s)\n",
                 static_cast<int>(result.status),
                 make_error_code(result.status).message().c_str());
    std::fflush(_stream);
}
// =========================== Progress printer ============================ }}}

BFGS_EXPORT auto minimize(objective_t const& objective,
                          bfgs_param_t const& params, gsl::span<double> const x)
    -> bfgs_result_t
{
    if (params.display == display_t::silent) {
        return minimize(objective, params, x, no_observer_t{});
    }
    return minimize(objective, params, x, progress_printer_t{params.display});
}

BFGS_NAMESPACE_END
