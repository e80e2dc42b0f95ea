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

/// \file config.hpp
///
///

#include <cstdio>
#include <system_error>

/// \cond
#if defined(__clang__)
#    define ZEROFPR_CLANG                                                      \
        (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif !defined(__GNUC__) && !defined(_MSC_VER)
// clang-format off
#error "Unsupported compiler."
// clang-format on
#endif
/// \endcond

/// \cond
#if defined(WIN32) || defined(_WIN32)
#    define ZEROFPR_EXPORT __declspec(dllexport)
#    define ZEROFPR_FORCEINLINE __forceinline inline
#    define ZEROFPR_LIKELY(cond) (cond)
#    define ZEROFPR_UNLIKELY(cond) (cond)
#    define ZEROFPR_CURRENT_FUNCTION __FUNCTION__
#else
#    define ZEROFPR_EXPORT __attribute__((visibility("default")))
#    define ZEROFPR_FORCEINLINE __attribute__((always_inline)) inline
#    define ZEROFPR_LIKELY(cond) __builtin_expect(!!(cond), 1)
#    define ZEROFPR_UNLIKELY(cond) __builtin_expect(!!(cond), 0)
#    define ZEROFPR_CURRENT_FUNCTION __PRETTY_FUNCTION__
#endif
/// \endcond

/// \cond
#define ZEROFPR_NAMESPACE regls::zerofpr
#define ZEROFPR_NAMESPACE_BEGIN                                                \
    namespace regls {                                                          \
    namespace zerofpr {
#define ZEROFPR_NAMESPACE_END                                                  \
    } /*namespace zerofpr*/                                                    \
    } /*namespace regls*/
/// \endcond

#if defined(ZEROFPR_DEBUG)
/// \brief Produces some intermediate output which is useful for tracing steps
/// of the algorithm.
///
/// \note Used for debugging only
#    define ZEROFPR_TRACE(fmt, ...)                                            \
        do {                                                                   \
            ::std::fprintf(                                                    \
                stderr,                                                        \
                "\x1b[1m\x1b[97m%s:%i:\x1b[0m \x1b[90mtrace:\x1b[0m " fmt,     \
                __FILE__, __LINE__, __VA_ARGS__);                              \
        } while (false)
#else
#    define ZEROFPR_TRACE(fmt, ...) static_cast<void>(0)
#endif

/// \cond
// clang-format off
#define ZEROFPR_BUG_MESSAGE                                                    \
    "╔═════════════════════════════════════════════════════════════════╗\n"    \
    "║      Congratulations, you have found a bug in zerofpr-cpp!      ║\n"    \
    "║         Please, be so kind to submit it to the issue            ║\n"    \
    "║                    tracker of the project.                      ║\n"    \
    "╚═════════════════════════════════════════════════════════════════╝"
// clang-format on
/// \endcond

#if defined(ZEROFPR_DEBUG)
#    define ZEROFPR_ASSERT(cond, msg)                                          \
        (ZEROFPR_LIKELY(cond)                                                  \
             ? static_cast<void>(0)                                            \
             : ::ZEROFPR_NAMESPACE::detail::assert_fail(                       \
                 #cond, __FILE__, __LINE__,                                    \
                 static_cast<char const*>(ZEROFPR_CURRENT_FUNCTION), msg))
#else
/// \brief A slightly nicer alternative to #assert macro from `<cassert>`.
///
/// This macro can be used in `constexpr` and `noexcept` functions.
///
/// \note Enabled only when `ZEROFPR_DEBUG` is defined.
#    define ZEROFPR_ASSERT(cond, msg) static_cast<void>(0)
#endif

ZEROFPR_NAMESPACE_BEGIN

/// Return codes used by zerofpr-cpp.
enum class status_t {
    success = 0,
    too_many_iterations,
    out_of_memory,
    invalid_tolerance,
    invalid_step_size,
    invalid_beta,
    invalid_trial_budget,
    invalid_shrink_factor,
    invalid_report_interval,
    invalid_argument,
    dimension_mismatch,
    non_finite_value,
};

/// #status_t can be used with `std::error_code`.
auto make_error_code(status_t) noexcept -> std::error_code;

namespace detail {
/// \brief Terminates the program with a pretty message.
///
/// This function is called whenever an assertion fails.
[[noreturn]] auto assert_fail(char const* expr, char const* file, unsigned line,
                              char const* function, char const* msg) noexcept
    -> void;
} // namespace detail

ZEROFPR_NAMESPACE_END

namespace std {
/// Make `status_t` act as an error code.
template <>
struct is_error_code_enum<::ZEROFPR_NAMESPACE::status_t> : true_type {};
} // namespace std
