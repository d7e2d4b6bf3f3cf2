//===- owire/Stream/ByteSink.hpp ------------------------------------===//
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
/// This file defines the external sinks a writer can flush to.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/ArrayRef.hpp>
#include <core/Common/Vec.hpp>
#include <owire/Basic/ErrorCodes.hpp>
#include <cstdio>

namespace owire {

/// The abstract output of a stream. Implementations must report failures
/// instead of dropping bytes.
class ByteSink {
public:
  virtual ~ByteSink() = default;

  /// Consumes all of \p Bytes, or fails.
  virtual OwError write(ArrayRef<u8> Bytes) = 0;

  /// Pushes any bytes held by the sink to their destination.
  virtual OwError flush() { return OwError::OK; }

private:
  virtual void anchor();
};

/// Appends to a caller-owned vector.
class VecSink final : public ByteSink {
  Vec<u8>& Data;
public:
  explicit VecSink(Vec<u8>& Data OWIRE_LIFETIMEBOUND) : Data(Data) {}

  OwError write(ArrayRef<u8> Bytes) override;

  Vec<u8>& buffer() { return Data; }
  const Vec<u8>& buffer() const { return Data; }

private:
  void anchor() override;
};

/// Writes to a C stream. The stream is not owned.
class FileSink final : public ByteSink {
  std::FILE* File;
public:
  explicit FileSink(std::FILE* File) : File(File) {}

  OwError write(ArrayRef<u8> Bytes) override;
  OwError flush() override;

  std::FILE* file() const { return File; }

private:
  void anchor() override;
};

} // namespace owire
