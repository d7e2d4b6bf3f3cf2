//===- owire/Encode/ObjectWriter.hpp --------------------------------===//
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
/// This file defines ObjectWriter, the encoder for acyclic object graphs.
///
//===----------------------------------------------------------------===//

#pragma once

#include <owire/Basic/FieldContext.hpp>
#include <owire/Basic/Tags.hpp>
#include <owire/Encode/ClassNameRegistry.hpp>
#include <owire/Encode/WriteKind.hpp>
#include <owire/Stream/OutBuffer.hpp>

namespace owire {

class ArrayObject;
class ByteSink;
class ClassDescriptor;
class Value;
class WireConfig;

/// Writes values to a stream, assuming no object is reachable twice.
/// Object identity is never tracked: a shared object is written once per
/// reference and a cycle never terminates.
///
/// A writer is not thread safe. Create one per thread (or pool them and
/// call `resetForReuse`), and share the `WireConfig` between them.
class ObjectWriter {
  const WireConfig& Config;
  OutBuffer Out;
  ClassNameRegistry ClassNames;
  bool Closed = false;

public:
  /// Writes to an internal buffer, read it with `getBuffer`.
  explicit ObjectWriter(const WireConfig& Config OWIRE_LIFETIMEBOUND);

  /// Writes to \p Sink, flushing when the buffer passes the flush
  /// threshold of the config.
  ObjectWriter(ByteSink& Sink OWIRE_LIFETIMEBOUND,
               const WireConfig& Config OWIRE_LIFETIMEBOUND);

  ObjectWriter(const ObjectWriter&) = delete;
  ObjectWriter& operator=(const ObjectWriter&) = delete;

  const WireConfig& getConfig() const { return Config; }

  ////////////////////////////////////////////////////////////////////////
  // Values

  /// Writes a top-level value. The root slot has no declared type and
  /// may list the classes expected there.
  OwError writeObject(const Value& Val,
                      ArrayRef<const ClassInfo*> PossibleTypes = {});

  /// Writes \p Val as the content of the slot described by \p Ctx.
  OwError writeValue(const Value& Val, const FieldContext& Ctx);

  /// Writes the fields of \p Val with the default field encoder. Custom
  /// serializers may call this to write the fields they do not handle.
  OwError writeFields(const Value& Val, const ClassDescriptor& Desc);

  ////////////////////////////////////////////////////////////////////////
  // Primitives
  //
  // For custom serializers. Each fails with `kClosedStream` once the
  // stream is closed, and writes nothing.

  OwError writeTag(Tag T);
  OwError writeByte(u8 Byte);
  OwError writeCInt(i32 Val);
  OwError writeCLong(i64 Val);
  OwError writeCShort(u16 Val);
  OwError writeStringUTF(StrRef Str);

  /// Writes the descriptor of \p Cls, the name on the first occurrence in
  /// the stream and the short id after that.
  OwError writeClass(const ClassInfo& Cls, const FieldContext& Ctx);

  ////////////////////////////////////////////////////////////////////////
  // Lifecycle

  /// Flushes buffered bytes to the sink, if any.
  OwError flush();

  /// Flushes and permanently closes the stream. Every later write or reset
  /// fails with `kClosedStream`. Closing twice is allowed.
  OwError close();

  /// Clears the class cache and the byte counter, then binds \p Sink, or
  /// the internal buffer when \p Sink is null. Buffered bytes are dropped.
  OwError resetForReuse(ByteSink* Sink = nullptr);

  /// Clears the class cache and the byte counter, then writes into
  /// \p Storage. Its contents are discarded, its capacity is reused.
  OwError resetForReuse(Vec<u8> Storage);

  ////////////////////////////////////////////////////////////////////////
  // Observers

  bool isClosed() const { return Closed; }

  /// Total bytes written since construction or the last reset.
  u64 getWritten() const { return Out.getWritten(); }

  /// The bytes not yet flushed. Without a sink this is the whole stream.
  ArrayRef<u8> getBuffer() const { return Out.buffer(); }
  Vec<u8> getCopyOfWrittenBuffer() const { return Out.copyOfBuffer(); }

  /// Count of classes written by name since the last reset.
  usize getCachedClassCount() const { return ClassNames.size(); }

private:
  OwError encodeValue(const Value& Val, const FieldContext& Ctx);

  OwError writeEnum(const Value& Val, const FieldContext& Ctx);
  OwError writeGeneric(const Value& Val, const FieldContext& Ctx);
  OwError writeObjectHeader(const ClassDescriptor& Desc,
                            const FieldContext& Ctx);
  OwError writeArray(const ArrayObject& Arr, const FieldContext& Ctx);
  OwError writeArrayElements(const ArrayObject& Arr, const FieldContext& Ctx);
  OwError writeFieldsOf(const ClassInfo& Cls, ArrayRef<Value>& Remaining);
  OwError writePrimitive(const ClassInfo& Type, const Value& Val);
  OwError encodeClass(const ClassInfo& Cls, const FieldContext& Ctx);

  void putTag(Tag T) { Out.writeByte(static_cast<u8>(T)); }

  OwError checkOpen(const char* Op) const;
};

} // namespace owire
