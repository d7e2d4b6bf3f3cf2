//===- owire/Encode/ClassNameRegistry.hpp ---------------------------===//
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
/// This file defines the per-stream cache of written class descriptors.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/Map.hpp>
#include <owire/Basic/ErrorCodes.hpp>

namespace owire {

class ClassDescriptor;
class ClassInfo;
class OutBuffer;
class WireConfig;

/// Assigns short ids to the classes written in a stream. The first
/// occurrence of an unregistered class writes its name, every later one
/// writes the id. Never shared between streams.
class ClassNameRegistry {
  const WireConfig* Config;
  /// Ids assigned in this stream.
  Map<const ClassInfo*, u16> Ids;
  /// Preregistered ids known when the stream started. Classes registered
  /// later are written by name until the next reset.
  u32 RegisteredBase = 0;
  /// The next dynamic id. Starts after the preregistered ids.
  u32 NextId = 1;

public:
  explicit ClassNameRegistry(const WireConfig& Config);

  /// Writes \p Desc as `CShort(id)` when an id is known, otherwise as
  /// `CShort(0)` followed by the class name, and assigns the next id.
  OwError encodeClass(OutBuffer& Out, const ClassDescriptor& Desc);

  /// Forgets every id assigned in this stream, and picks up classes
  /// registered since the last reset.
  void clear();

  /// The id of the class of \p Desc, or 0 when it has none yet.
  u16 getId(const ClassDescriptor& Desc) const;

  /// Count of classes written by name in this stream.
  usize size() const { return Ids.size(); }
};

} // namespace owire
