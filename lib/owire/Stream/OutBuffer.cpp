//===- owire/Stream/OutBuffer.cpp -----------------------------------===//
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
/// This file implements the output buffer.
///
//===----------------------------------------------------------------===//

#include "owire/Stream/OutBuffer.hpp"
#include "owire/Stream/ByteSink.hpp"
#include <core/Support/Logging.hpp>
#include <limits>

#define DEBUG_TYPE "OutBuffer"

using namespace owire;

template <typename T, typename IntT>
static constexpr bool fitsIn(IntT Val) {
  return Val >= IntT(std::numeric_limits<T>::min())
      && Val <= IntT(std::numeric_limits<T>::max());
}

OutBuffer::OutBuffer(usize InitialSize, usize FlushThreshold) :
 FlushThreshold(FlushThreshold), InitialSize(InitialSize) {
  Buffer.reserve(InitialSize);
}

void OutBuffer::writeCInt(i32 Val) {
  if (Val > -127 && Val <= 127) {
    this->writeByte(static_cast<u8>(Val));
  } else if (fitsIn<i16>(Val)) {
    this->writeByte(0x80);
    this->writeLE(static_cast<i16>(Val));
  } else {
    this->writeByte(0x81);
    this->writeLE(Val);
  }
}

void OutBuffer::writeCLong(i64 Val) {
  if (Val > -126 && Val <= 127) {
    this->writeByte(static_cast<u8>(Val));
  } else if (fitsIn<i16>(Val)) {
    this->writeByte(0x80);
    this->writeLE(static_cast<i16>(Val));
  } else if (fitsIn<i32>(Val)) {
    this->writeByte(0x81);
    this->writeLE(static_cast<i32>(Val));
  } else {
    this->writeByte(0x82);
    this->writeLE(Val);
  }
}

void OutBuffer::writeCShort(u16 Val) {
  if (Val < 255) {
    this->writeByte(static_cast<u8>(Val));
  } else {
    this->writeByte(0xFF);
    this->writeLE(Val);
  }
}

void OutBuffer::writeStringUTF(StrRef Str) {
  owire_assert(Str.size() <= usize(std::numeric_limits<i32>::max()));
  this->writeCInt(static_cast<i32>(Str.size()));
  this->writeBytes(ArrayRef<u8>(Str.bytes_begin(), Str.bytes_end()));
}

//////////////////////////////////////////////////////////////////////////
// Flushing

OwError OutBuffer::flushAndClear() {
  owire_assert(Sink);
  if (Buffer.empty())
    return OwError::OK;

  LOG_EXTRA("flushing {} bytes.\n", Buffer.size());
  owire_try(Sink->write(Buffer));
  Flushed += Buffer.size();
  Buffer.clear();
  return OwError::OK;
}

OwError OutBuffer::flushIfNeeded() {
  if (!Sink || Buffer.size() <= FlushThreshold)
    return OwError::OK;
  return this->flushAndClear();
}

OwError OutBuffer::flush() {
  if (!Sink)
    return OwError::OK;
  owire_try(this->flushAndClear());
  return Sink->flush();
}

//////////////////////////////////////////////////////////////////////////
// Lifecycle

void OutBuffer::reset() {
  Buffer.clear();
  if (Buffer.capacity() < InitialSize)
    Buffer.reserve(InitialSize);
  Flushed = 0;
}

void OutBuffer::reset(Vec<u8>&& Storage) {
  Buffer = std::move(Storage);
  this->reset();
}
