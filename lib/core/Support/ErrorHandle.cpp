//===- Support/ErrorHandle.cpp --------------------------------------===//
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

#include <Support/ErrorHandle.hpp>
#include <Common/StrRef.hpp>
#include <Support/Debug.hpp>
#include <cstdio>
#include <cstdlib>
#include <fmt/color.h>

#if OWIRE_DEBUG
# define TRAP_IF_DEBUGGING() do {                 \
  if (::owire::DebugFlag >= LogLevel::EXTRA)      \
    OWIRE_DBGTRAP;                                \
} while(0)
#else
# define TRAP_IF_DEBUGGING() (void(0))
#endif

using namespace owire;

static const char* getAssertionMessage(H::AssertionKind Kind) {
  using enum H::AssertionKind;
  switch (Kind) {
   case ASK_Assert:
    return "Assertion failed";
   case ASK_Assume:
    return "Assumption failed";
   case ASK_Invariant:
    return "Invariant failed";
   case ASK_Unreachable:
    return "Unreachable reached";
  }
  return "??? failed";
}

[[noreturn]] void owire::report_fatal_error(const char* Msg, bool GenCrashDiag) {
  owire::report_fatal_error(StrRef(Msg), GenCrashDiag);
}

[[noreturn]] void owire::report_fatal_error(StrRef Msg, bool GenCrashDiag) {
  fmt::print(stderr, "OBJWIRE ERROR: {}\n", Msg);
  std::fflush(stderr);

  if (GenCrashDiag) {
    std::abort();
  } else {
    TRAP_IF_DEBUGGING();
    std::exit(1);
  }
}

[[noreturn]] void owire::owire_assert_impl(
 H::AssertionKind Kind, const char* Msg,
 const char* File, unsigned Line
) {
  constexpr auto kLoc = fmt::terminal_color::bright_yellow;
  constexpr auto kErr = fmt::terminal_color::bright_red;
  if (File) {
    auto Buf = fmt::format("\nAt \"{}:{}\"", File, Line);
    fmt::print(stderr, "{}:\n  ",
      fmt::styled(Buf, fmt::fg(kLoc)));
  }

  auto* const Pre = getAssertionMessage(Kind);
  if (Msg && Msg[0]) {
    fmt::print(stderr, "{}: {}",
      Pre, fmt::styled(Msg, fmt::fg(kErr)));
  } else {
    fmt::print(stderr, "{}", Pre);
  }
  fmt::print(stderr, ".\n");
  TRAP_IF_DEBUGGING();
  std::abort();
}
