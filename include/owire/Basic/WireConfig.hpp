//===- owire/Basic/WireConfig.hpp -----------------------------------===//
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
/// This file defines WireConfig, the configuration shared by every writer,
/// and the class descriptors it hands out.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/Box.hpp>
#include <core/Common/Map.hpp>
#include <owire/Basic/ClassInfo.hpp>
#include <owire/Basic/ErrorCodes.hpp>
#include <owire/Basic/WireOptions.hpp>
#include <shared_mutex>
#include <string_view>

namespace owire {

class ObjectSerializer;

/// What a writer needs to know about a class to write objects of it.
class ClassDescriptor {
  friend class WireConfig;
  const ClassInfo* Class = nullptr;
  const ObjectSerializer* Serializer = nullptr;
  u16 RegisteredId = 0;

public:
  ClassDescriptor(const ClassInfo& Class, const ObjectSerializer* Ser,
                  u16 RegisteredId) :
   Class(&Class), Serializer(Ser), RegisteredId(RegisteredId) {}

  const ClassInfo& getClass() const { return *Class; }
  StrRef getName() const { return Class->getName(); }

  /// The custom encoder, null when the default field encoder is used.
  const ObjectSerializer* getSerializer() const { return Serializer; }

  /// The preregistered id, or 0.
  u16 getRegisteredId() const { return RegisteredId; }
  bool isRegistered() const { return RegisteredId != 0; }
};

/// Holds the classes, preregistered ids and custom encoders used by a set
/// of writers. Define every class before sharing a config; after that all
/// lookups may run concurrently from any thread.
class WireConfig {
  struct SerializerEntry {
    Box<ObjectSerializer> Ser;
    bool AlsoForSubclasses = false;
  };

  WireOptions Opts;

  /// Every class defined by this config.
  Vec<Box<ClassInfo>> Classes;
  /// Keys view the names owned by `Classes`.
  Map<std::string_view, ClassInfo*> ClassesByName;
  /// Array classes, keyed by component.
  Map<const ClassInfo*, ClassInfo*> ArrayClasses;

  /// Preregistered ids, starting at 1.
  Map<const ClassInfo*, u16> RegisteredIds;
  Map<const ClassInfo*, SerializerEntry> Serializers;

  /// Descriptors created on first request, never destroyed.
  mutable Map<const ClassInfo*, Box<ClassDescriptor>> Descriptors;

  mutable std::shared_mutex Mtx;

public:
  explicit WireConfig(WireOptions Opts = {});
  WireConfig(const WireConfig&) = delete;
  WireConfig& operator=(const WireConfig&) = delete;
  ~WireConfig();

  const WireOptions& getOptions() const { return Opts; }

  ////////////////////////////////////////////////////////////////////////
  // Definition

  /// Defines a class. Names must be unique within a config.
  ClassInfo& defineClass(StrRef Name, const ClassInfo* Super = nullptr);

  /// Defines an enum with the constants \p Constants, in ordinal order.
  ClassInfo& defineEnum(StrRef Name, ArrayRef<StrRef> Constants);

  /// Defines the class of a constant with its own body, nested inside
  /// \p Enclosing. When \p Enclosing is an enum it is also the super.
  ClassInfo& defineEnumConstantClass(const ClassInfo& Enclosing, StrRef Name);

  /// Returns the array class of \p Component, creating it once.
  const ClassInfo& getArrayClass(const ClassInfo& Component);

  /// Looks up a class defined by this config, or a builtin.
  const ClassInfo* lookupClass(StrRef Name) const;

  /// Preregisters \p Cls. Preregistered classes are always written in the
  /// compact form. Registering a class twice keeps its first id.
  /// A writer only sees ids registered before its construction or last
  /// reset. Finish registration before sharing the config.
  OwError registerClass(const ClassInfo& Cls);

  /// Attaches a custom encoder to \p Cls, and to its subclasses when
  /// \p AlsoForSubclasses is set.
  OwError registerSerializer(const ClassInfo& Cls,
                             Box<ObjectSerializer> Ser,
                             bool AlsoForSubclasses = false);

  ////////////////////////////////////////////////////////////////////////
  // Lookup

  /// Returns the descriptor of \p Cls. The reference stays valid for the
  /// lifetime of the config.
  const ClassDescriptor& resolve(const FieldContext& Ctx,
                                 const ClassInfo& Cls) const;

  /// Preregistered id of \p Cls, or 0.
  u16 getRegisteredId(const ClassInfo& Cls) const;
  usize getRegisteredCount() const;

private:
  ClassInfo& addClass(StrRef Name, ClassKind Kind);
  const ObjectSerializer* findSerializer(const ClassInfo& Cls) const;
};

} // namespace owire
