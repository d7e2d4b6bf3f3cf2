//===- owire/Basic/ClassInfo.hpp ------------------------------------===//
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
/// This file defines ClassInfo, the runtime class metadata used for
/// type dispatch and the default field encoder.
///
//===----------------------------------------------------------------===//

#pragma once

#include <owire/Basic/FieldContext.hpp>

namespace owire {

enum class ClassKind : u8 {
  Object,
  String,
  Integer,
  Long,
  Boolean,
  PrimInt,
  PrimLong,
  PrimBool,
  Array,
  Enum,
  /// A constant with its own body, the class of the constant is a
  /// subclass of the enum nested inside it.
  EnumConstant,
};

/// Describes a concrete class. Builtins are process-wide singletons, every
/// other class is owned by a `WireConfig`.
class ClassInfo {
  String Name;
  ClassKind Kind;
  const ClassInfo* Super = nullptr;
  const ClassInfo* Enclosing = nullptr;
  /// Element type, arrays only.
  const ClassInfo* Component = nullptr;
  /// Constant names in ordinal order, enums only.
  Vec<String> EnumConstants;
  /// Own fields in declared order. Inherited fields come first on the wire.
  Vec<FieldContext> Fields;

public:
  ClassInfo(StrRef Name, ClassKind Kind);
  ClassInfo(const ClassInfo&) = delete;
  ClassInfo& operator=(const ClassInfo&) = delete;

  /// @name Builtins
  /// @{
  static const ClassInfo& getObject();
  static const ClassInfo& getString();
  static const ClassInfo& getInteger();
  static const ClassInfo& getLong();
  static const ClassInfo& getBoolean();
  static const ClassInfo& getPrimInt();
  static const ClassInfo& getPrimLong();
  static const ClassInfo& getPrimBool();
  /// @}

  StrRef getName() const { return Name; }
  ClassKind getKind() const { return Kind; }
  const ClassInfo* getSuper() const { return Super; }
  const ClassInfo* getEnclosing() const { return Enclosing; }
  const ClassInfo* getComponent() const { return Component; }
  ArrayRef<String> getEnumConstants() const { return EnumConstants; }
  ArrayRef<FieldContext> fields() const { return Fields; }

  /// Own fields plus every inherited field.
  usize getTotalFieldCount() const;

  bool isPrimitive() const {
    return Kind == ClassKind::PrimInt
        || Kind == ClassKind::PrimLong
        || Kind == ClassKind::PrimBool;
  }
  bool isBoxed() const {
    return Kind == ClassKind::Integer
        || Kind == ClassKind::Long
        || Kind == ClassKind::Boolean;
  }
  bool isArray() const { return Kind == ClassKind::Array; }
  bool isEnum() const { return Kind == ClassKind::Enum; }
  bool isString() const { return Kind == ClassKind::String; }

  /// Returns `true` if \p Other is this class or one of its supers.
  bool isSubclassOf(const ClassInfo& Other) const;

  /// The nearest enum on the enclosing chain, starting at this class.
  /// Returns null when the chain never reaches an enum.
  const ClassInfo* findEnumType() const;

  /// Returns the ordinal of \p Constant, or -1 when it is not a constant.
  i32 getOrdinal(StrRef Constant) const;

  ////////////////////////////////////////////////////////////////////////
  // Definition

  ClassInfo& setSuper(const ClassInfo* NewSuper);
  ClassInfo& setEnclosing(const ClassInfo* NewEnclosing);
  ClassInfo& setComponent(const ClassInfo* NewComponent);
  ClassInfo& setEnumConstants(ArrayRef<StrRef> Names);
  ClassInfo& addField(FieldContext Field);
  ClassInfo& addField(StrRef FieldName, const ClassInfo& Type);
};

StrRef get_class_kind_name(ClassKind K) noexcept OWIRE_READNONE;

} // namespace owire
