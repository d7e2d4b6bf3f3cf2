//===- Support/Debug.cpp --------------------------------------------===//
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
//
// This file implements a handy way of adding debugging information to your
// code, without it being enabled all of the time.
//
//===----------------------------------------------------------------===//

#include <Support/Debug.hpp>
#include <Common/StrRef.hpp>
#include <Common/String.hpp>
#include <Common/Vec.hpp>
#include <atomic>
#include <mutex>

#undef isCurrentDebugType
#undef setCurrentDebugType
#undef setCurrentDebugTypes

using namespace owire;

namespace owire {
/// Exported level, raised by the driver or by tests.
LogLevelType DebugFlag = LogLevel::NONE;
} // namespace owire

static std::atomic<std::FILE*> DebugStream = nullptr;

std::FILE* owire::dbgs() {
  std::FILE* Strm = DebugStream.load(std::memory_order_relaxed);
  return Strm ? Strm : stderr;
}

void owire::setDebugStream(std::FILE* Stream) {
  DebugStream.store(Stream, std::memory_order_relaxed);
}

#if OWIRE_DEBUG_LOG

namespace {
struct DebugTypeList {
  std::mutex Lock;
  Vec<String> Types;
};
} // namespace `anonymous`

static DebugTypeList& getCurrentDebugTypes() {
  static DebugTypeList List;
  return List;
}

static bool IsEmptyCStr(const char *Str) noexcept {
  if (Str == nullptr)
    return true;
  return *Str == '\0';
}

/// Return true if the specified string is the selected debug type, or if no
/// type was selected.
bool owire::isCurrentDebugType(const char *DebugType) {
  auto& List = getCurrentDebugTypes();
  std::lock_guard Guard(List.Lock);
  if (List.Types.empty())
    return true;
  StrRef DebugTypeStr(DebugType);
  for (auto& D : List.Types) {
    if (DebugTypeStr.equals(D))
      return true;
  }
  return false;
}

void owire::setCurrentDebugType(const char *Type) {
  owire::setCurrentDebugTypes(&Type, 1);
}

void owire::setCurrentDebugTypes(const char **Types, unsigned Count) {
  auto& List = getCurrentDebugTypes();
  std::lock_guard Guard(List.Lock);
  List.Types.clear();
  for (usize T = 0; T < Count; ++T) {
    const char *const Type = Types[T];
    if (IsEmptyCStr(Type))
      continue;
    List.Types.emplace_back(Type);
  }
}

#endif // OWIRE_DEBUG_LOG
