//===- owire/Basic/Tags.hpp -----------------------------------------===//
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
/// This file defines the tag bytes that lead every encoded value.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/Fundamental.hpp>
#include <core/Common/StrRef.hpp>

namespace owire {

/// The leading byte of every value. Fixed tags are negative when read as
/// `i8`, possible-type indices are `1..kMaxPossibleTypes`.
enum class Tag : u8 {
  Object          = 0x00,
  Null            = 0xFF,
  Typed           = 0xFD,
  String          = 0xFC,
  Array           = 0xFB,
  Enum            = 0xFA,
  BigInt          = 0xF7,
  BigLong         = 0xF6,
  BigBooleanTrue  = 0xF0,
  BigBooleanFalse = 0xEF,
  OneOf           = 0xEE,
};

/// Index tags are `i + 1`, they must stay below the smallest fixed tag.
OWIRE_CONST usize kMaxPossibleTypes = 127;
/// The `ONE_OF` index is a single byte.
OWIRE_CONST usize kMaxOneOfStrings = 255;

/// Returns the tag for the possible type at \p Ix.
constexpr u8 possibleTypeTag(usize Ix) {
  return static_cast<u8>(Ix + 1);
}

/// Returns `true` if \p Byte is a possible-type index tag.
constexpr bool isPossibleTypeTag(u8 Byte) {
  return Byte >= 1 && Byte <= kMaxPossibleTypes;
}

/// Gets the name of a tag byte, for diagnostics.
StrRef get_tag_name(u8 Byte) noexcept OWIRE_READNONE;

inline StrRef get_tag_name(Tag T) noexcept {
  return get_tag_name(static_cast<u8>(T));
}

} // namespace owire
