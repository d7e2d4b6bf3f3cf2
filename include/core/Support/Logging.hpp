//===- Support/Logging.hpp ------------------------------------------===//
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
/// This file provides macros for logging at different levels of verbosity.
///
//===----------------------------------------------------------------===//

#pragma once

#include <Support/Debug.hpp>
#if OWIRE_LOGGING
# include <fmt/color.h>
# include <fmt/format.h>
#endif

#if OWIRE_LOGGING

/// Format with a specified debug type.
# define LOG_FORMAT_WITH(LEVEL, TYPE, COLOR, ...)                             \
LOG_WITH_LEVEL_AND_TYPE(LEVEL, TYPE, do {                                     \
  ::fmt::print(::owire::dbgs(),                                               \
    ::fmt::fg(::fmt::terminal_color::COLOR), __VA_ARGS__);                    \
} while(false))

/// Format with the default debug type.
# define LOG_FORMAT(LEVEL, COLOR, ...)                                        \
 LOG_FORMAT_WITH(LEVEL, DEBUG_TYPE, COLOR, __VA_ARGS__)

#else
# define LOG_FORMAT_WITH(LEVEL, TYPE, COLOR, ...) do { } while(false)
# define LOG_FORMAT(LEVEL, COLOR, ...) do { } while(false)
#endif

/// Formats to `dbgs()` if the log level is at least `ERROR`.
#define LOG_ERROR(...) LOG_FORMAT(ERROR, bright_red,     __VA_ARGS__)
/// Formats to `dbgs()` if the log level is at least `WARN`.
#define LOG_WARN(...)  LOG_FORMAT(WARN,  bright_yellow,  __VA_ARGS__)
/// Formats to `dbgs()` if the log level is at least `INFO`.
#define LOG_INFO(...)  LOG_FORMAT(INFO,  bright_white,   __VA_ARGS__)
/// Formats to `dbgs()` if the log level is `EXTRA`.
#define LOG_EXTRA(...) LOG_FORMAT(EXTRA, bright_white,   __VA_ARGS__)

/// Formats to `dbgs()` if the log level is at least `ERROR`.
#define LOG_ERROR_WITH(TYPE, ...)                                             \
 LOG_FORMAT_WITH(ERROR, TYPE, bright_red, __VA_ARGS__)
/// Formats to `dbgs()` if the log level is at least `WARN`.
#define LOG_WARN_WITH(TYPE, ...)                                              \
 LOG_FORMAT_WITH(WARN,  TYPE, bright_yellow, __VA_ARGS__)
/// Formats to `dbgs()` if the log level is `EXTRA`.
#define LOG_EXTRA_WITH(TYPE, ...)                                             \
 LOG_FORMAT_WITH(EXTRA, TYPE, bright_white, __VA_ARGS__)
