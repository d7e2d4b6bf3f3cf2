//===- owire/Encode/ObjectSerializer.hpp ----------------------------===//
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
/// This file defines the interface for custom object encoders.
///
//===----------------------------------------------------------------===//

#pragma once

#include <owire/Basic/ErrorCodes.hpp>

namespace owire {

class ClassDescriptor;
class FieldContext;
class ObjectWriter;
class Value;

/// A custom encoder for the body of an object. It runs after the header of
/// the object has been written, and writes everything that follows.
/// Serializers are shared by every writer of a config, so they must not
/// hold per-stream state.
class ObjectSerializer {
public:
  virtual ~ObjectSerializer() = default;

  /// Writes the body of \p Val. \p StreamPos is the byte count of the
  /// stream when the body starts.
  virtual OwError writeObject(ObjectWriter& Out, const Value& Val,
                              const ClassDescriptor& Desc,
                              const FieldContext& Ctx,
                              u64 StreamPos) const = 0;

private:
  virtual void anchor();
};

} // namespace owire
