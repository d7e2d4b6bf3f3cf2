//===- owire/Encode/WriteKind.cpp -----------------------------------===//
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
/// This file implements the dispatch decisions of the object writer.
///
//===----------------------------------------------------------------===//

#include "owire/Encode/WriteKind.hpp"
#include "owire/Basic/Value.hpp"

using namespace owire;

static WriteDecision classifyString(StrRef Str, const FieldContext& Ctx) {
  const auto OneOf = Ctx.getOneOf();
  for (usize Ix = 0, E = OneOf.size(); Ix != E; ++Ix) {
    if (StrRef(OneOf[Ix]) == Str)
      return {WriteKind::OneOf, Ix};
  }
  return {WriteKind::String};
}

static bool isEnumSlot(const Value& Val, const FieldContext& Ctx) {
  if (Val.isEnum())
    return true;
  const ClassInfo* Declared = Ctx.getDeclaredType();
  return Declared && Declared->isEnum();
}

WriteDecision owire::classify(const Value& Val, const FieldContext& Ctx) {
  switch (Val.getKind()) {
  case Value::VK_Null:
    return {WriteKind::Null};
  case Value::VK_Str:
    return classifyString(Val.getStr(), Ctx);
  case Value::VK_Int:
    return {WriteKind::BigInt};
  case Value::VK_Long:
    return {WriteKind::BigLong};
  case Value::VK_Bool:
    return {WriteKind::BigBoolean};
  case Value::VK_Array:
    return {WriteKind::Array};
  case Value::VK_Enum:
  case Value::VK_Obj:
    break;
  }

  if (isEnumSlot(Val, Ctx))
    return {WriteKind::Enum};
  return {WriteKind::Object};
}

HeaderDecision owire::classifyHeader(const ClassInfo& Runtime,
                                     const FieldContext& Ctx) {
  if (&Runtime == Ctx.getDeclaredType())
    return {HeaderKind::Typed};

  const auto Possible = Ctx.getPossibleTypes();
  for (usize Ix = 0, E = Possible.size(); Ix != E; ++Ix) {
    if (Possible[Ix] == &Runtime)
      return {HeaderKind::PossibleType, Ix};
  }
  return {HeaderKind::Object};
}

StrRef owire::get_write_kind_name(WriteKind K) noexcept {
  switch (K) {
  case WriteKind::Null:       return "Null";
  case WriteKind::OneOf:      return "OneOf";
  case WriteKind::String:     return "String";
  case WriteKind::BigInt:     return "BigInt";
  case WriteKind::BigLong:    return "BigLong";
  case WriteKind::BigBoolean: return "BigBoolean";
  case WriteKind::Array:      return "Array";
  case WriteKind::Enum:       return "Enum";
  case WriteKind::Object:     return "Object";
  }
  return "Unknown";
}
