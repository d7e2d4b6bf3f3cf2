//===- owire/Stream/ByteSink.cpp ------------------------------------===//
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
/// This file implements the builtin sinks.
///
//===----------------------------------------------------------------===//

#include "owire/Stream/ByteSink.hpp"
#include <core/Support/Logging.hpp>
#include <cerrno>

#define DEBUG_TYPE "ByteSink"

using namespace owire;

void ByteSink::anchor() {}
void VecSink::anchor() {}
void FileSink::anchor() {}

OwError VecSink::write(ArrayRef<u8> Bytes) {
  Data.insert(Data.end(), Bytes.begin(), Bytes.end());
  return OwError::OK;
}

OwError FileSink::write(ArrayRef<u8> Bytes) {
  if OWIRE_UNLIKELY(!File) {
    LOG_ERROR("FileSink has no file.\n");
    return OwError::Sink(EBADF);
  }
  if (Bytes.empty())
    return OwError::OK;

  errno = 0;
  const usize Count = std::fwrite(Bytes.data(), 1, Bytes.size(), File);
  if OWIRE_UNLIKELY(Count != Bytes.size()) {
    const int Errno = errno ? errno : EIO;
    LOG_ERROR("short write: {} of {} bytes.\n", Count, Bytes.size());
    return OwError::Sink(Errno);
  }
  return OwError::OK;
}

OwError FileSink::flush() {
  if OWIRE_UNLIKELY(!File)
    return OwError::Sink(EBADF);
  errno = 0;
  if OWIRE_UNLIKELY(std::fflush(File) != 0) {
    const int Errno = errno ? errno : EIO;
    LOG_ERROR("fflush failed.\n");
    return OwError::Sink(Errno);
  }
  return OwError::OK;
}
