//===- owire/Basic/Tags.cpp -----------------------------------------===//
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
/// This file implements tag name lookup.
///
//===----------------------------------------------------------------===//

#include "owire/Basic/Tags.hpp"

using namespace owire;

StrRef owire::get_tag_name(u8 Byte) noexcept {
  switch (Tag(Byte)) {
  case Tag::Object:           return "OBJECT";
  case Tag::Null:             return "NULL";
  case Tag::Typed:            return "TYPED";
  case Tag::String:           return "STRING";
  case Tag::Array:            return "ARRAY";
  case Tag::Enum:             return "ENUM";
  case Tag::BigInt:           return "BIG_INT";
  case Tag::BigLong:          return "BIG_LONG";
  case Tag::BigBooleanTrue:   return "BIG_BOOLEAN_TRUE";
  case Tag::BigBooleanFalse:  return "BIG_BOOLEAN_FALSE";
  case Tag::OneOf:            return "ONE_OF";
  default:
    break;
  }

  if (isPossibleTypeTag(Byte))
    return "POSSIBLE_TYPE";
  return "UNKNOWN";
}
