//===- owire/Basic/FieldContext.cpp ---------------------------------===//
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
/// This file implements FieldContext.
///
//===----------------------------------------------------------------===//

#include "owire/Basic/FieldContext.hpp"
#include "owire/Basic/ClassInfo.hpp"

using namespace owire;

FieldContext::FieldContext(StrRef Name, const ClassInfo* Declared) :
 Name(Name.data(), Name.size()), Declared(Declared) {
}

FieldContext FieldContext::Root(ArrayRef<const ClassInfo*> PossibleTypes) {
  FieldContext Ctx;
  Ctx.withPossibleTypes(PossibleTypes);
  return Ctx;
}

FieldContext& FieldContext::withPossibleTypes(
 ArrayRef<const ClassInfo*> Types) {
  PossibleTypes.assign(Types.begin(), Types.end());
  return *this;
}

FieldContext& FieldContext::withOneOf(std::initializer_list<StrRef> Strs) {
  return this->withOneOf(ArrayRef<StrRef>(Strs));
}

FieldContext& FieldContext::withOneOf(ArrayRef<StrRef> Strs) {
  OneOf.clear();
  OneOf.reserve(Strs.size());
  for (StrRef S : Strs)
    OneOf.emplace_back(S.data(), S.size());
  return *this;
}

FieldContext FieldContext::forElements(const ClassInfo* Component) const {
  FieldContext Ctx;
  Ctx.Declared = Component;
  Ctx.PossibleTypes = this->PossibleTypes;
  return Ctx;
}

bool FieldContext::isPrimitive() const {
  return Declared && Declared->isPrimitive();
}
