//===- owire/Basic/ErrorCodes.hpp -----------------------------------===//
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
///
/// \file
/// This file defines the error codes used by the library.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/Fundamental.hpp>
#include <core/Common/StrRef.hpp>
#include <core/Common/String.hpp>
#include <fmt/format.h>

namespace owire {

enum class ErrorCode : u32 {
  kOk      = 0,
  kSuccess = 0,

  /// The stream was closed, it can no longer be written to or reused.
  kClosedStream,

  /// An enum-like value whose enclosing classes never reach an enum type.
  kUnrepresentableEnum,

  /// A value does not match the shape its class or field declares.
  kTypeMismatch,

  /// A closed set index does not fit in its tag.
  kOutOfBounds,

  /// The output sink failed. `Extra` holds `errno` when one is available.
  kSinkError,

  /// The configuration could not satisfy a definition request.
  kInvalidConfig,

  /// Any error that does not fall into the other categories.
  kUnexpectedError,
  Last = kUnexpectedError
};

StrRef get_error_name(ErrorCode E) noexcept OWIRE_READNONE;
StrRef get_error_message(ErrorCode E) noexcept OWIRE_READNONE;

/// Works like `Error`, returns `true` when a non-ok state is held.
class OWIRE_NODISCARD OwError {
  ErrorCode EC;
  u32 Extra = 0;

  constexpr OwError(ErrorCode E, u32 Extra) : EC(E), Extra(Extra) {}

public:
  using enum ErrorCode;

  static const OwError OK;
  static const OwError CLOSED;

  ////////////////////////////////////////////////////////////////////////
  // Ctors

  /// Construct an error from a code.
  constexpr OwError(ErrorCode E) : EC(E) {}

  /// Sink failure, with the `errno` reported by the platform.
  static OwError Sink(int Errno) noexcept OWIRE_READNONE;

  ////////////////////////////////////////////////////////////////////////
  // Observers

  ErrorCode ec() const { return EC; }
  u32 extra() const { return Extra; }
  const char* what() const noexcept OWIRE_READONLY;
  StrRef msg() const noexcept OWIRE_READONLY;
  /// Gets message with any custom information.
  String fullMsg() const;

  explicit operator ErrorCode() const { return EC; }
  explicit operator bool() const {
    return OWIRE_UNLIKELY(EC != ErrorCode::kSuccess);
  }

  friend bool operator==(const OwError& LHS, const OwError& RHS) {
    return LHS.EC == RHS.EC;
  }
};

inline bool operator==(const OwError& LHS, ErrorCode RHS) {
  return LHS.ec() == RHS;
}

inline bool operator==(ErrorCode LHS, const OwError& RHS) {
  return LHS == RHS.ec();
}

OWIRE_CONST OwError OwError::OK     = OwError::kOk;
OWIRE_CONST OwError OwError::CLOSED = OwError::kClosedStream;

static_assert(sizeof(OwError) == 8);

} // namespace owire

template <>
struct fmt::formatter<owire::OwError> : fmt::formatter<fmt::string_view> {
  auto format(const owire::OwError& E, format_context& Ctx) const {
    const auto Str = E.fullMsg();
    return fmt::formatter<fmt::string_view>::format(
      fmt::string_view(Str.data(), Str.size()), Ctx);
  }
};
