//===- owire/Basic/Value.hpp ----------------------------------------===//
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
/// This file defines Value, a non-owning handle to a runtime value, and the
/// Object and ArrayObject aggregates it can refer to.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Support/ErrorHandle.hpp>
#include <owire/Basic/ClassInfo.hpp>

namespace owire {

class Object;
class ArrayObject;

/// A runtime value as seen by the writer. Strings, objects and arrays are
/// referenced, not owned, and must outlive the write.
class Value {
public:
  enum Kind : u8 {
    VK_Null,
    VK_Str,
    VK_Int,
    VK_Long,
    VK_Bool,
    VK_Enum,
    VK_Obj,
    VK_Array,
  };

private:
  Kind K = VK_Null;
  /// Runtime class. Null only for `VK_Null`.
  const ClassInfo* Class = nullptr;
  /// Integral payload, or the ordinal of an enum constant.
  i64 Num = 0;
  StrRef Text;
  const void* Ptr = nullptr;

  Value(Kind K, const ClassInfo* Class) : K(K), Class(Class) {}

public:
  Value() = default;

  static Value Null() { return Value(); }
  static Value Str(StrRef S);
  /// A boxed `Integer`.
  static Value Int(i32 V);
  /// A boxed `Long`.
  static Value Long(i64 V);
  /// A boxed `Boolean`.
  static Value Bool(bool V);
  /// An enum constant. \p Runtime is the enum itself, or the class of a
  /// constant with its own body.
  static Value Enum(const ClassInfo& Runtime, u32 Ordinal);
  static Value Of(const Object& Obj OWIRE_LIFETIMEBOUND);
  static Value Of(const ArrayObject& Arr OWIRE_LIFETIMEBOUND);

  Kind getKind() const { return K; }
  const ClassInfo* getClass() const { return Class; }

  bool isNull() const { return K == VK_Null; }
  bool isStr() const { return K == VK_Str; }
  bool isEnum() const { return K == VK_Enum; }
  bool isObject() const { return K == VK_Obj; }
  bool isArray() const { return K == VK_Array; }

  StrRef getStr() const {
    owire_assert(isStr());
    return Text;
  }
  i32 getInt() const {
    owire_assert(K == VK_Int);
    return static_cast<i32>(Num);
  }
  i64 getLong() const {
    owire_assert(K == VK_Long);
    return Num;
  }
  bool getBool() const {
    owire_assert(K == VK_Bool);
    return Num != 0;
  }
  u32 getOrdinal() const {
    owire_assert(isEnum());
    return static_cast<u32>(Num);
  }
  const Object* getObject() const {
    return isObject() ? static_cast<const Object*>(Ptr) : nullptr;
  }
  const ArrayObject* getArray() const {
    return isArray() ? static_cast<const ArrayObject*>(Ptr) : nullptr;
  }
};

/// An instance of a user class. Field values are stored in wire order:
/// inherited fields first, then the fields of the class itself.
class Object {
  const ClassInfo* Class;
  Vec<Value> Fields;
public:
  Object(const ClassInfo& Class, std::initializer_list<Value> Fields);
  Object(const ClassInfo& Class, Vec<Value> Fields);

  const ClassInfo& getClass() const { return *Class; }
  ArrayRef<Value> fields() const { return Fields; }
  usize size() const { return Fields.size(); }

  void set(usize Ix, Value V) {
    owire_assert(Ix < Fields.size());
    Fields[Ix] = V;
  }
};

/// An instance of an array class.
class ArrayObject {
  const ClassInfo* Class;
  Vec<Value> Elements;
public:
  ArrayObject(const ClassInfo& ArrayClass, std::initializer_list<Value> Elts);
  ArrayObject(const ClassInfo& ArrayClass, Vec<Value> Elts);

  const ClassInfo& getClass() const { return *Class; }
  const ClassInfo& getComponent() const { return *Class->getComponent(); }
  ArrayRef<Value> elements() const { return Elements; }
  usize size() const { return Elements.size(); }

  void push_back(Value V) { Elements.push_back(V); }
};

} // namespace owire
