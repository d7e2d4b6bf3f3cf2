//===- owire/Encode/ClassNameRegistry.cpp ---------------------------===//
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
/// This file implements the per-stream class cache.
///
//===----------------------------------------------------------------===//

#include "owire/Encode/ClassNameRegistry.hpp"
#include "owire/Basic/WireConfig.hpp"
#include "owire/Stream/OutBuffer.hpp"
#include <core/Support/Logging.hpp>

#define DEBUG_TYPE "ClassNameRegistry"

using namespace owire;

ClassNameRegistry::ClassNameRegistry(const WireConfig& Config) :
 Config(&Config) {
  this->clear();
}

void ClassNameRegistry::clear() {
  Ids.clear();
  RegisteredBase = u32(Config->getRegisteredCount());
  NextId = RegisteredBase + 1;
}

u16 ClassNameRegistry::getId(const ClassDescriptor& Desc) const {
  if (auto It = Ids.find(&Desc.getClass()); It != Ids.end())
    return It->second;
  // Ids above the base may already be taken by this stream.
  if (Desc.isRegistered() && Desc.getRegisteredId() <= RegisteredBase)
    return Desc.getRegisteredId();
  return 0;
}

OwError ClassNameRegistry::encodeClass(OutBuffer& Out,
                                       const ClassDescriptor& Desc) {
  if (const u16 Id = this->getId(Desc)) {
    Out.writeCShort(Id);
    return OwError::OK;
  }

  if OWIRE_UNLIKELY(NextId > 0xFFFF) {
    LOG_ERROR("class id space exhausted at '{}'.\n", Desc.getName());
    return OwError::kOutOfBounds;
  }

  LOG_EXTRA("first write of '{}', id {}.\n", Desc.getName(), NextId);
  Out.writeCShort(0);
  Out.writeStringUTF(Desc.getName());
  Ids.emplace(&Desc.getClass(), static_cast<u16>(NextId++));
  return OwError::OK;
}
