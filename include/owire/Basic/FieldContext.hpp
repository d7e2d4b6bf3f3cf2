//===- owire/Basic/FieldContext.hpp ---------------------------------===//
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
/// This file defines FieldContext, the static description of a write slot.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/ArrayRef.hpp>
#include <core/Common/StrRef.hpp>
#include <core/Common/String.hpp>
#include <core/Common/Vec.hpp>
#include <initializer_list>

namespace owire {

class ClassInfo;

/// The static knowledge a writer has about the slot a value came from.
/// Contexts are built once, then only read.
class FieldContext {
  /// Name of the field, empty for roots and array elements.
  String Name;
  /// The type a reader statically expects. Null at the top level.
  const ClassInfo* Declared = nullptr;
  /// Ordered closed set of concrete types. Empty means unbounded.
  Vec<const ClassInfo*> PossibleTypes;
  /// Ordered closed set of string literals. Empty means unbounded.
  Vec<String> OneOf;

public:
  FieldContext() = default;
  FieldContext(StrRef Name, const ClassInfo* Declared);

  /// Context for a top-level write.
  static FieldContext Root(ArrayRef<const ClassInfo*> PossibleTypes = {});

  FieldContext& withPossibleTypes(ArrayRef<const ClassInfo*> Types);
  FieldContext& withOneOf(std::initializer_list<StrRef> Strs);
  FieldContext& withOneOf(ArrayRef<StrRef> Strs);

  /// The context used for the elements of an array at this slot.
  /// The declared type becomes \p Component, possible types are kept and
  /// the string set is dropped.
  FieldContext forElements(const ClassInfo* Component) const;

  StrRef getName() const { return Name; }
  const ClassInfo* getDeclaredType() const { return Declared; }
  ArrayRef<const ClassInfo*> getPossibleTypes() const { return PossibleTypes; }
  ArrayRef<String> getOneOf() const { return OneOf; }

  bool hasPossibleTypes() const { return !PossibleTypes.empty(); }
  bool hasOneOf() const { return !OneOf.empty(); }

  /// Returns `true` if the declared type is `int`, `long` or `boolean`.
  bool isPrimitive() const;
};

} // namespace owire
