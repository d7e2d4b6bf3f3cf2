//===- owire/Basic/Value.cpp ----------------------------------------===//
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
/// This file implements Value, Object and ArrayObject.
///
//===----------------------------------------------------------------===//

#include "owire/Basic/Value.hpp"

using namespace owire;

Value Value::Str(StrRef S) {
  Value V(VK_Str, &ClassInfo::getString());
  V.Text = S;
  return V;
}

Value Value::Int(i32 I) {
  Value V(VK_Int, &ClassInfo::getInteger());
  V.Num = I;
  return V;
}

Value Value::Long(i64 L) {
  Value V(VK_Long, &ClassInfo::getLong());
  V.Num = L;
  return V;
}

Value Value::Bool(bool B) {
  Value V(VK_Bool, &ClassInfo::getBoolean());
  V.Num = B ? 1 : 0;
  return V;
}

Value Value::Enum(const ClassInfo& Runtime, u32 Ordinal) {
  Value V(VK_Enum, &Runtime);
  V.Num = Ordinal;
  return V;
}

Value Value::Of(const Object& Obj) {
  Value V(VK_Obj, &Obj.getClass());
  V.Ptr = &Obj;
  return V;
}

Value Value::Of(const ArrayObject& Arr) {
  Value V(VK_Array, &Arr.getClass());
  V.Ptr = &Arr;
  return V;
}

//////////////////////////////////////////////////////////////////////////
// Aggregates

Object::Object(const ClassInfo& Class, std::initializer_list<Value> Fields) :
 Class(&Class), Fields(Fields) {
}

Object::Object(const ClassInfo& Class, Vec<Value> Fields) :
 Class(&Class), Fields(std::move(Fields)) {
}

ArrayObject::ArrayObject(const ClassInfo& ArrayClass,
                         std::initializer_list<Value> Elts) :
 Class(&ArrayClass), Elements(Elts) {
  owire_assert(ArrayClass.isArray() && ArrayClass.getComponent());
}

ArrayObject::ArrayObject(const ClassInfo& ArrayClass, Vec<Value> Elts) :
 Class(&ArrayClass), Elements(std::move(Elts)) {
  owire_assert(ArrayClass.isArray() && ArrayClass.getComponent());
}
