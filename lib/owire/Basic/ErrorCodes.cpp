//===- owire/Basic/ErrorCodes.cpp -----------------------------------===//
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

#include "owire/Basic/ErrorCodes.hpp"
#include <cstring>
#include <fmt/format.h>

using namespace owire;

static constexpr usize kErrorCodeCount = usize(ErrorCode::Last) + 1;

static constexpr const char* ErrorCodeNames[kErrorCodeCount] {
  "Success",
  "ClosedStream",
  "UnrepresentableEnum",
  "TypeMismatch",
  "OutOfBounds",
  "SinkError",
  "InvalidConfig",
  "UnexpectedError",
};

static constexpr const char* ErrorCodeMessages[kErrorCodeCount] {
  "Success",
  "Stream Is Closed",
  "Enum Type Could Not Be Resolved",
  "Value Does Not Match Its Declared Type",
  "Closed Set Index Out Of Bounds",
  "Output Sink Failed",
  "Invalid Configuration",
  "Unexpected Error",
};

inline static const char*
 get_error_name_what(ErrorCode E) noexcept {
  const usize Ix = static_cast<usize>(E);
  if OWIRE_LIKELY(Ix < kErrorCodeCount)
    return ErrorCodeNames[Ix];
  return "UNKNOWN_ERROR";
}

inline static const char*
 get_error_message_what(ErrorCode E) noexcept {
  const usize Ix = static_cast<usize>(E);
  if OWIRE_LIKELY(Ix < kErrorCodeCount)
    return ErrorCodeMessages[Ix];
  return "UNKNOWN ERROR";
}

StrRef owire::get_error_name(ErrorCode E) noexcept {
  return StrRef(get_error_name_what(E));
}
StrRef owire::get_error_message(ErrorCode E) noexcept {
  return StrRef(get_error_message_what(E));
}

//////////////////////////////////////////////////////////////////////////
// Error

OwError OwError::Sink(int Errno) noexcept {
  return OwError(kSinkError, u32(Errno));
}

const char* OwError::what() const noexcept {
  return get_error_message_what(this->EC);
}

StrRef OwError::msg() const noexcept {
  return owire::get_error_message(this->EC);
}

String OwError::fullMsg() const {
  if (EC == kSinkError && Extra != 0) {
    return String(fmt::format("{}: {}", msg(),
      std::strerror(int(Extra))));
  }
  return String(msg().data(), msg().size());
}
