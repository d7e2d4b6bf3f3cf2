//===- Support/ErrorHandle.hpp --------------------------------------===//
//
// Copyright (C) 2024-2025 Eightfold
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
//     limitations under the License.
//
//===----------------------------------------------------------------===//

#pragma once

#include <Common/Features.hpp>

#if !defined(NDEBUG) || OWIRE_INVARIANTS
# define OWIRE_ASSERTS 1
#else
# undef OWIRE_ASSERTS
#endif

namespace owire {
namespace H {

enum AssertionKind : int {
  ASK_Assert,
  ASK_Assume,
  ASK_Invariant,
  ASK_Unreachable,
};

} // namespace H

class StrRef;

/// @brief Reports a fatal error.
[[noreturn]] void report_fatal_error(
  const char* Msg, bool GenCrashDiag = true);
/// @brief Reports a fatal error.
[[noreturn]] void report_fatal_error(
  StrRef Msg, bool GenCrashDiag = true);

[[noreturn]] void owire_assert_impl(
 H::AssertionKind Kind, const char* Msg = nullptr,
 const char* File = nullptr, unsigned Line = 0
);

[[noreturn]] inline void owire_unreachable_impl() {
#ifdef OWIRE_UNREACHABLE
  OWIRE_UNREACHABLE;
#endif
  OWIRE_DBGTRAP;
}

} // namespace owire

/// Returns the error from the current function if it holds a failure.
#define owire_try(...) do {                                                   \
  auto&& _u_Err = (__VA_ARGS__);                                              \
  if OWIRE_UNLIKELY(_u_Err) {                                                 \
    return _u_Err;                                                            \
  }                                                                           \
} while(0)

/// Simplified assertion handler, provides required arguments for you.
#define owire_fail(KIND, MSG) ::owire::owire_assert_impl(                     \
  ::owire::H::KIND, MSG, OWIRE_FUNCTION, __LINE__)

/// Simplified assertion handler, provides required arguments for you.
#define owire_fail_stringify(KIND, ...) owire_fail(KIND, "`" #__VA_ARGS__ "`")

#ifndef NDEBUG
# define owire_unreachable(MSG) owire_fail(ASK_Unreachable, MSG)
#elif !defined(OWIRE_UNREACHABLE)
# define owire_unreachable(MSG) ::owire::owire_unreachable_impl()
#else
# define owire_unreachable(MSG) do {                                          \
    OWIRE_TRAP;                                                               \
    OWIRE_UNREACHABLE;                                                        \
  } while(0)
#endif

#if OWIRE_ASSERTS
# define owire_assume(...) do {                                               \
    if OWIRE_UNLIKELY(!static_cast<bool>(__VA_ARGS__))                        \
      owire_fail_stringify(ASK_Assume, __VA_ARGS__);                          \
  } while(0)
#else
# define owire_assume(...) (void(0))
#endif

/// Provides runtime assertion checking for a generic kind.
#define owire_assert_(KIND, EXPR, ...) void(OWIRE_LIKELY((EXPR))              \
  ? (void(0))                                                                 \
  : (owire_fail(KIND, ("`" #EXPR "`" __VA_OPT__(". Reason: ") #__VA_ARGS__))))

#if OWIRE_ASSERTS
/// Takes `(condition, "message")`, asserts in debug mode.
# define owire_assert(EXPR, ...) \
 owire_assert_(ASK_Assert, EXPR __VA_OPT__(,) __VA_ARGS__)
#else
# define owire_assert(EXPR, ...) (void(0))
#endif

#if OWIRE_INVARIANTS
/// Takes `(condition, "message")`, checks when invariants on.
# define owire_invariant(EXPR, ...)                                           \
 owire_assert_(ASK_Invariant, EXPR __VA_OPT__(,) __VA_ARGS__)
#else
/// Noop in this mode.
# define owire_invariant(EXPR, ...) (void(0))
#endif
