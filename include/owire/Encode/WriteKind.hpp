//===- owire/Encode/WriteKind.hpp -----------------------------------===//
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
/// This file defines the dispatch decisions of the object writer. Both
/// decisions are pure, they depend only on the value and its context.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/Fundamental.hpp>
#include <core/Common/StrRef.hpp>

namespace owire {

class ClassInfo;
class FieldContext;
class Value;

/// The encoder selected for a value. Cases are checked in declaration
/// order and the first match wins.
enum class WriteKind : u8 {
  Null,
  OneOf,
  String,
  BigInt,
  BigLong,
  BigBoolean,
  Array,
  Enum,
  Object,
};

struct WriteDecision {
  WriteKind Kind;
  /// Index into the closed string set, `OneOf` only.
  usize Index = 0;
};

/// Selects the encoder for \p Val written at \p Ctx.
WriteDecision classify(const Value& Val, const FieldContext& Ctx);

/// The form of the header of a generic object.
enum class HeaderKind : u8 {
  /// The runtime class is the declared type.
  Typed,
  /// The runtime class is in the possible-types set.
  PossibleType,
  /// Full class descriptor.
  Object,
};

struct HeaderDecision {
  HeaderKind Kind;
  /// Index into the possible-types set, `PossibleType` only.
  usize Index = 0;
};

/// Selects the header for an object of class \p Runtime written at \p Ctx.
HeaderDecision classifyHeader(const ClassInfo& Runtime,
                              const FieldContext& Ctx);

StrRef get_write_kind_name(WriteKind K) noexcept OWIRE_READNONE;

} // namespace owire
