//===- owire/Basic/WireOptions.hpp ----------------------------------===//
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
/// This file defines the options shared by every writer of a config.
///
//===----------------------------------------------------------------===//

#pragma once

#include <core/Common/Fundamental.hpp>

namespace owire {

struct WireOptions {
  /// Capacity reserved for the internal buffer of a writer.
  /// Default: 4096
  usize BufferSize = 4096;

  /// Buffered bytes (unit B) a writer may hold before a top-level write
  /// flushes them to its sink. Has no effect without a sink.
  /// Default: 64 KiB
  usize FlushThreshold = usize(64) << 10;
};

} // namespace owire
