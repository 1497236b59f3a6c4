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

/// \file config.hpp
///
/// Common macros and the #status_t enumeration.

#include <cstdio>

#if defined(__clang__)
#    define BFGS_CLANG                                                         \
        (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#endif

/// \cond
#if defined(WIN32) || defined(_WIN32)
#    define BFGS_EXPORT __declspec(dllexport)
#    define BFGS_FORCEINLINE __forceinline inline
#    define BFGS_LIKELY(cond) (cond)
#    define BFGS_UNLIKELY(cond) (cond)
#    define BFGS_CURRENT_FUNCTION __FUNCTION__
#else
#    define BFGS_EXPORT __attribute__((visibility("default")))
#    define BFGS_FORCEINLINE __attribute__((always_inline)) inline
#    define BFGS_LIKELY(cond) __builtin_expect(!!(cond), 1)
#    define BFGS_UNLIKELY(cond) __builtin_expect(!!(cond), 0)
#    define BFGS_CURRENT_FUNCTION __PRETTY_FUNCTION__
#endif

#define BFGS_NAMESPACE optim::bfgs
#define BFGS_NAMESPACE_BEGIN                                                   \
    namespace optim {                                                          \
    namespace bfgs {
#define BFGS_NAMESPACE_END                                                     \
    } /*namespace bfgs*/                                                       \
    } /*namespace optim*/
/// \endcond

#if defined(BFGS_DEBUG)
/// Prints a `file:line: trace:` prefixed message to `stderr`.
#    define BFGS_TRACE(fmt, ...)                                               \
        do {                                                                   \
            ::std::fprintf(                                                    \
                stderr,                                                        \
                "\x1b[1m\x1b[97m%s:%i:\x1b[0m \x1b[90mtrace:\x1b[0m " fmt,     \
                __FILE__, __LINE__, __VA_ARGS__);                              \
        } while (false)

/// Checks an internal invariant and terminates via detail::assert_fail if
/// it does not hold. Usable in `constexpr` and `noexcept` functions.
#    define BFGS_ASSERT(cond, msg)                                             \
        (BFGS_LIKELY(cond)                                                     \
             ? static_cast<void>(0)                                            \
             : ::BFGS_NAMESPACE::detail::assert_fail(                          \
                 #cond, __FILE__, __LINE__,                                    \
                 static_cast<char const*>(BFGS_CURRENT_FUNCTION), msg))
#else
#    define BFGS_TRACE(fmt, ...) static_cast<void>(0)
#    define BFGS_ASSERT(cond, msg) static_cast<void>(0)
#endif

/// \cond
// clang-format off
#define BFGS_BUG_MESSAGE                                                     \
    "╔═════════════════════════════════════════════════════════════════╗\n"  \
    "║        Congratulations, you have found a bug in bfgs-cpp!       ║\n"  \
    "║          Please, be so kind to report it to the authors         ║\n"  \
    "╚═════════════════════════════════════════════════════════════════╝"
// clang-format on
/// \endcond

BFGS_NAMESPACE_BEGIN

/// Return codes used by bfgs-cpp.
///
/// The first three values are the terminal states of a solver run and keep
/// their numeric values (0, 1 and 2) so they can be reported as exit flags.
enum class status_t {
    not_converged  = 0, ///< Iteration budget exhausted
    converged      = 1, ///< Both value and step tolerances satisfied
    step_underflow = 2, ///< Line search could not decrease the objective
    /// Line search found a step which decreases the objective.
    success,
    invalid_argument,
    invalid_x_tolerance,
    invalid_function_tolerance,
    invalid_backtrack_factor,
    invalid_step_bounds,
    /// Curvature matrix is no longer numerically positive-definite.
    rounding_errors_prevent_progress,
};

namespace detail {
/// \brief Terminates the program with a pretty message.
///
/// This function is called whenever an assertion fails.
[[noreturn]] auto assert_fail(char const* expr, char const* file, unsigned line,
                              char const* function, char const* msg) noexcept
    -> void;
} // namespace detail

BFGS_NAMESPACE_END
