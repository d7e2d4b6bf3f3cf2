//===- owire/Stream/OutBuffer.hpp -----------------------------------===//
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
/// This file defines the growable output buffer and the compact integer
/// primitives every encoder writes through.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/ArrayRef.hpp>
#include <core/Common/StrRef.hpp>
#include <core/Common/Vec.hpp>
#include <owire/Basic/ErrorCodes.hpp>
#include <type_traits>

namespace owire {

class ByteSink;

/// Holds the bytes of a stream until they are flushed to a `ByteSink`.
/// Without a sink the buffer holds every byte of the stream.
class OutBuffer {
  /// Unflushed bytes, or the whole stream when `Sink` is null.
  Vec<u8> Buffer;

  /// The sink `Buffer` flushes to. Not owned.
  ByteSink* Sink = nullptr;

  /// Bytes already handed to `Sink`.
  u64 Flushed = 0;

  /// The threshold (unit B) to flush to `Sink` after a top-level write.
  usize FlushThreshold = 0;

  /// Capacity requested on construction and reset.
  usize InitialSize = 0;

public:
  OutBuffer(usize InitialSize, usize FlushThreshold);

  /// Binds \p NewSink, which may be null. Does not flush.
  void bind(ByteSink* NewSink) { Sink = NewSink; }
  ByteSink* sink() const { return Sink; }

  ////////////////////////////////////////////////////////////////////////
  // Raw writes

  void writeByte(u8 Val) { Buffer.push_back(Val); }

  void writeBytes(ArrayRef<u8> Bytes) {
    Buffer.insert(Buffer.end(), Bytes.begin(), Bytes.end());
  }

  /// Writes \p Val in little endian order.
  template <typename IntT>
  void writeLE(IntT Val) {
    static_assert(std::is_integral_v<IntT>);
    using UIntT = std::make_unsigned_t<IntT>;
    auto Bits = static_cast<UIntT>(Val);
    for (usize Ix = 0; Ix < sizeof(IntT); ++Ix) {
      Buffer.push_back(static_cast<u8>(Bits & 0xFF));
      if constexpr (sizeof(IntT) > 1)
        Bits >>= 8;
    }
  }

  ////////////////////////////////////////////////////////////////////////
  // Compact writes

  /// `(-127, 127]` is one byte, then `0x80` + i16, then `0x81` + i32.
  void writeCInt(i32 Val);

  /// `(-126, 127]` is one byte, then `0x80` + i16, `0x81` + i32,
  /// then `0x82` + i64.
  void writeCLong(i64 Val);

  /// `[0, 255)` is one byte, otherwise `0xFF` + u16.
  void writeCShort(u16 Val);

  /// The byte length as a compact int, then the UTF-8 bytes.
  void writeStringUTF(StrRef Str);

  ////////////////////////////////////////////////////////////////////////
  // Flushing

  /// Flushes to the sink if the buffered bytes pass the threshold.
  OwError flushIfNeeded();

  /// Flushes every buffered byte, then flushes the sink itself.
  OwError flush();

  ////////////////////////////////////////////////////////////////////////
  // Lifecycle

  /// Empties the buffer and zeroes the byte counter. Keeps the sink.
  void reset();

  /// Adopts the storage of \p Storage. Its contents are discarded.
  void reset(Vec<u8>&& Storage);

  ////////////////////////////////////////////////////////////////////////
  // Observers

  /// Total bytes written in this stream, flushed or not.
  u64 getWritten() const { return Flushed + Buffer.size(); }
  /// Bytes not yet handed to a sink.
  usize size() const { return Buffer.size(); }
  ArrayRef<u8> buffer() const { return Buffer; }
  Vec<u8> copyOfBuffer() const { return Buffer; }

private:
  OwError flushAndClear();
};

} // namespace owire
