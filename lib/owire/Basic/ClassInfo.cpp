//===- owire/Basic/ClassInfo.cpp ------------------------------------===//
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
/// This file implements ClassInfo and the builtin classes.
///
//===----------------------------------------------------------------===//

#include "owire/Basic/ClassInfo.hpp"
#include <core/Support/ErrorHandle.hpp>

using namespace owire;

ClassInfo::ClassInfo(StrRef Name, ClassKind Kind) :
 Name(Name.data(), Name.size()), Kind(Kind) {
}

#define DEFINE_BUILTIN(FUNC, NAME, KIND)                                      \
const ClassInfo& ClassInfo::FUNC() {                                          \
  static const ClassInfo Builtin(NAME, ClassKind::KIND);                      \
  return Builtin;                                                             \
}

DEFINE_BUILTIN(getObject,   "Object",   Object)
DEFINE_BUILTIN(getString,   "String",   String)
DEFINE_BUILTIN(getInteger,  "Integer",  Integer)
DEFINE_BUILTIN(getLong,     "Long",     Long)
DEFINE_BUILTIN(getBoolean,  "Boolean",  Boolean)
DEFINE_BUILTIN(getPrimInt,  "int",      PrimInt)
DEFINE_BUILTIN(getPrimLong, "long",     PrimLong)
DEFINE_BUILTIN(getPrimBool, "boolean",  PrimBool)

#undef DEFINE_BUILTIN

usize ClassInfo::getTotalFieldCount() const {
  usize Count = 0;
  for (const ClassInfo* C = this; C; C = C->Super)
    Count += C->Fields.size();
  return Count;
}

bool ClassInfo::isSubclassOf(const ClassInfo& Other) const {
  for (const ClassInfo* C = this; C; C = C->Super) {
    if (C == &Other)
      return true;
  }
  return false;
}

const ClassInfo* ClassInfo::findEnumType() const {
  const ClassInfo* C = this;
  while (C && !C->isEnum())
    C = C->Enclosing;
  return C;
}

i32 ClassInfo::getOrdinal(StrRef Constant) const {
  for (usize Ix = 0, E = EnumConstants.size(); Ix != E; ++Ix) {
    if (StrRef(EnumConstants[Ix]) == Constant)
      return static_cast<i32>(Ix);
  }
  return -1;
}

//////////////////////////////////////////////////////////////////////////
// Definition

ClassInfo& ClassInfo::setSuper(const ClassInfo* NewSuper) {
  owire_assert(NewSuper != this, "a class cannot extend itself");
  Super = NewSuper;
  return *this;
}

ClassInfo& ClassInfo::setEnclosing(const ClassInfo* NewEnclosing) {
  owire_assert(NewEnclosing != this, "a class cannot enclose itself");
  Enclosing = NewEnclosing;
  return *this;
}

ClassInfo& ClassInfo::setComponent(const ClassInfo* NewComponent) {
  owire_assert(isArray());
  Component = NewComponent;
  return *this;
}

ClassInfo& ClassInfo::setEnumConstants(ArrayRef<StrRef> Names) {
  owire_assert(isEnum());
  EnumConstants.clear();
  EnumConstants.reserve(Names.size());
  for (StrRef N : Names)
    EnumConstants.emplace_back(N.data(), N.size());
  return *this;
}

ClassInfo& ClassInfo::addField(FieldContext Field) {
  Fields.push_back(std::move(Field));
  return *this;
}

ClassInfo& ClassInfo::addField(StrRef FieldName, const ClassInfo& Type) {
  return this->addField(FieldContext(FieldName, &Type));
}

StrRef owire::get_class_kind_name(ClassKind K) noexcept {
  switch (K) {
  case ClassKind::Object:       return "Object";
  case ClassKind::String:       return "String";
  case ClassKind::Integer:      return "Integer";
  case ClassKind::Long:         return "Long";
  case ClassKind::Boolean:      return "Boolean";
  case ClassKind::PrimInt:      return "PrimInt";
  case ClassKind::PrimLong:     return "PrimLong";
  case ClassKind::PrimBool:     return "PrimBool";
  case ClassKind::Array:        return "Array";
  case ClassKind::Enum:         return "Enum";
  case ClassKind::EnumConstant: return "EnumConstant";
  }
  return "Unknown";
}
