//===- owire/Basic/WireConfig.cpp -----------------------------------===//
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
/// This file implements WireConfig.
///
//===----------------------------------------------------------------===//

#include "owire/Basic/WireConfig.hpp"
#include "owire/Encode/ObjectSerializer.hpp"
#include <core/Support/ErrorHandle.hpp>
#include <core/Support/Logging.hpp>
#include <fmt/format.h>
#include <mutex>

#define DEBUG_TYPE "WireConfig"

using namespace owire;

/// Ids are written as compact shorts, 0 marks a class name.
static constexpr usize kMaxClassId = 0xFFFF;

static const ClassInfo* lookupBuiltin(StrRef Name) {
  static const ClassInfo* const Builtins[] {
    &ClassInfo::getObject(),
    &ClassInfo::getString(),
    &ClassInfo::getInteger(),
    &ClassInfo::getLong(),
    &ClassInfo::getBoolean(),
    &ClassInfo::getPrimInt(),
    &ClassInfo::getPrimLong(),
    &ClassInfo::getPrimBool(),
  };
  for (const ClassInfo* Cls : Builtins) {
    if (Cls->getName() == Name)
      return Cls;
  }
  return nullptr;
}

WireConfig::WireConfig(WireOptions Opts) : Opts(Opts) {}
WireConfig::~WireConfig() = default;

//////////////////////////////////////////////////////////////////////////
// Definition

ClassInfo& WireConfig::addClass(StrRef Name, ClassKind Kind) {
  if (lookupBuiltin(Name) || ClassesByName.contains(Name)) {
    report_fatal_error(
      fmt::format("class '{}' is already defined", Name));
  }

  auto& Cls = Classes.emplace_back(std::make_unique<ClassInfo>(Name, Kind));
  ClassesByName.emplace(std::string_view(Cls->getName()), Cls.get());
  LOG_EXTRA("defined {} '{}'.\n", get_class_kind_name(Kind), Name);
  return *Cls;
}

ClassInfo& WireConfig::defineClass(StrRef Name, const ClassInfo* Super) {
  std::unique_lock Lock(Mtx);
  ClassInfo& Cls = this->addClass(Name, ClassKind::Object);
  if (Super)
    Cls.setSuper(Super);
  return Cls;
}

ClassInfo& WireConfig::defineEnum(StrRef Name, ArrayRef<StrRef> Constants) {
  std::unique_lock Lock(Mtx);
  ClassInfo& Cls = this->addClass(Name, ClassKind::Enum);
  Cls.setEnumConstants(Constants);
  return Cls;
}

ClassInfo& WireConfig::defineEnumConstantClass(
 const ClassInfo& Enclosing, StrRef Name) {
  std::unique_lock Lock(Mtx);
  ClassInfo& Cls = this->addClass(Name, ClassKind::EnumConstant);
  Cls.setEnclosing(&Enclosing);
  if (Enclosing.isEnum())
    Cls.setSuper(&Enclosing);
  return Cls;
}

const ClassInfo& WireConfig::getArrayClass(const ClassInfo& Component) {
  {
    std::shared_lock Lock(Mtx);
    if (auto It = ArrayClasses.find(&Component); It != ArrayClasses.end())
      return *It->second;
  }

  std::unique_lock Lock(Mtx);
  auto [It, Inserted] = ArrayClasses.try_emplace(&Component, nullptr);
  if (Inserted) {
    const auto Name = fmt::format("{}[]", Component.getName());
    ClassInfo& Cls = this->addClass(Name, ClassKind::Array);
    Cls.setComponent(&Component);
    It->second = &Cls;
  }
  return *It->second;
}

const ClassInfo* WireConfig::lookupClass(StrRef Name) const {
  if (const ClassInfo* Builtin = lookupBuiltin(Name))
    return Builtin;
  std::shared_lock Lock(Mtx);
  if (auto It = ClassesByName.find(Name); It != ClassesByName.end())
    return It->second;
  return nullptr;
}

//////////////////////////////////////////////////////////////////////////
// Registration

OwError WireConfig::registerClass(const ClassInfo& Cls) {
  if OWIRE_UNLIKELY(Cls.isPrimitive()) {
    LOG_ERROR("cannot register primitive '{}'.\n", Cls.getName());
    return OwError::kInvalidConfig;
  }

  std::unique_lock Lock(Mtx);
  if (RegisteredIds.contains(&Cls))
    return OwError::OK;
  if OWIRE_UNLIKELY(RegisteredIds.size() + 1 >= kMaxClassId) {
    LOG_ERROR("too many registered classes.\n");
    return OwError::kInvalidConfig;
  }

  const auto Id = static_cast<u16>(RegisteredIds.size() + 1);
  RegisteredIds.emplace(&Cls, Id);
  if (auto It = Descriptors.find(&Cls); It != Descriptors.end())
    It->second->RegisteredId = Id;

  LOG_INFO("registered '{}' as {}.\n", Cls.getName(), Id);
  return OwError::OK;
}

OwError WireConfig::registerSerializer(const ClassInfo& Cls,
                                       Box<ObjectSerializer> Ser,
                                       bool AlsoForSubclasses) {
  if OWIRE_UNLIKELY(!Ser) {
    LOG_ERROR("null serializer for '{}'.\n", Cls.getName());
    return OwError::kInvalidConfig;
  }

  switch (Cls.getKind()) {
  case ClassKind::Object:
    break;
  default:
    // These kinds are written by the specialized encoders, a serializer
    // would never be reached.
    LOG_ERROR("cannot attach a serializer to {} '{}'.\n",
      get_class_kind_name(Cls.getKind()), Cls.getName());
    return OwError::kInvalidConfig;
  }

  std::unique_lock Lock(Mtx);
  Serializers.insert_or_assign(&Cls,
    SerializerEntry{std::move(Ser), AlsoForSubclasses});

  for (auto& [Key, Desc] : Descriptors)
    Desc->Serializer = this->findSerializer(*Key);
  return OwError::OK;
}

//////////////////////////////////////////////////////////////////////////
// Lookup

const ObjectSerializer*
 WireConfig::findSerializer(const ClassInfo& Cls) const {
  if (auto It = Serializers.find(&Cls); It != Serializers.end())
    return It->second.Ser.get();
  for (const ClassInfo* S = Cls.getSuper(); S; S = S->getSuper()) {
    auto It = Serializers.find(S);
    if (It != Serializers.end() && It->second.AlsoForSubclasses)
      return It->second.Ser.get();
  }
  return nullptr;
}

const ClassDescriptor& WireConfig::resolve(
 const FieldContext& /*Ctx*/, const ClassInfo& Cls) const {
  {
    std::shared_lock Lock(Mtx);
    if (auto It = Descriptors.find(&Cls); It != Descriptors.end())
      return *It->second;
  }

  std::unique_lock Lock(Mtx);
  auto [It, Inserted] = Descriptors.try_emplace(&Cls, nullptr);
  if (Inserted) {
    u16 Id = 0;
    if (auto RI = RegisteredIds.find(&Cls); RI != RegisteredIds.end())
      Id = RI->second;
    It->second = std::make_unique<ClassDescriptor>(
      Cls, this->findSerializer(Cls), Id);
    LOG_EXTRA("new descriptor for '{}'.\n", Cls.getName());
  }
  return *It->second;
}

u16 WireConfig::getRegisteredId(const ClassInfo& Cls) const {
  std::shared_lock Lock(Mtx);
  if (auto It = RegisteredIds.find(&Cls); It != RegisteredIds.end())
    return It->second;
  return 0;
}

usize WireConfig::getRegisteredCount() const {
  std::shared_lock Lock(Mtx);
  return RegisteredIds.size();
}
