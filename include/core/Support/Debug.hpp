//===- Support/Debug.hpp --------------------------------------------===//
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
// Wrap your code with the DEBUG_ONLY() macro, and it will run when the debug
// flag is raised. DEBUG_ONLY() requires the DEBUG_TYPE macro to be defined.
// Set it to "foo" to specify that your debug code belongs to class "foo".
// Only do this after including Debug.hpp and not around any #include of
// headers. Calling `setCurrentDebugType("foo")` then enables JUST the debug
// information for the foo class.
//
// When compiling without OWIRE_DEBUG, all code in DEBUG_ONLY() statements
// disappears, so it does not affect the runtime of the code.
//
//===----------------------------------------------------------------===//

#pragma once

#include <Config/Config.inc>
#include <Support/LogLevel.hpp>
#include <cstdio>

#if OWIRE_DEBUG || OWIRE_LOGGING
# define OWIRE_DEBUG_LOG 1
#else
# undef OWIRE_DEBUG_LOG
#endif

namespace owire {

#if OWIRE_DEBUG_LOG

/// `isCurrentDebugType` - Return true if the specified string is the debug
/// type that was selected, or if no type was selected.
bool isCurrentDebugType(const char *Type);

/// `setCurrentDebugType` - Restrict output to a single debug type.
/// Note that `DebugFlag` also needs to be raised for output to be produced.
void setCurrentDebugType(const char *Type);

/// `setCurrentDebugTypes` - Restrict output to a list of debug types.
/// Passing a `Count` of 0 removes the restriction.
void setCurrentDebugTypes(const char **Types, unsigned Count);

# define isCurrentDebugType(X) (::owire::isCurrentDebugType(X))
# define setCurrentDebugType(X) (::owire::setCurrentDebugType(X))
# define setCurrentDebugTypes(X, N) (::owire::setCurrentDebugTypes(X, N))
#else
# define isCurrentDebugType(X) (false)
# define setCurrentDebugType(X) do { (void)(X); } while (false)
# define setCurrentDebugTypes(X, N) do { (void)(X); (void)(N); } while (false)
#endif

#if OWIRE_DEBUG

/// `DEBUG_WITH_TYPE` macro - This macro should be used to emit debug
/// information. If the debug flag is raised and `TYPE` is selected, the code
/// passed to the macro will be executed. Example:
///
/// DEBUG_WITH_TYPE("ClassNames", fmt::print(dbgs(), "{} ids\n", N));
# define DEBUG_WITH_TYPE(TYPE, ...)                                           \
do {                                                                          \
  if ((!!::owire::DebugFlag) && isCurrentDebugType(TYPE)) {                   \
    __VA_ARGS__;                                                              \
  }                                                                           \
} while (false)

#else
# define DEBUG_WITH_TYPE(TYPE, ...) do { } while (false)
#endif

#if OWIRE_LOGGING

/// `LOG_WITH_LEVEL_AND_TYPE` macro - Same as `DEBUG_WITH_TYPE`, but with the
/// logging level specified as well.
# define LOG_WITH_LEVEL_AND_TYPE(LEVEL, TYPE, ...)                            \
do {                                                                          \
  if (hasLogLevel(LEVEL, ::owire::DebugFlag) && isCurrentDebugType(TYPE)) {   \
    __VA_ARGS__;                                                              \
  }                                                                           \
} while (false)

/// `LOG_WITH_LEVEL` macro - Runs the code when the logging level is at least
/// `LEVEL`. Example:
///
/// LOG_WITH_LEVEL(WARN, fmt::print(dbgs(), "flush threshold is 0\n"));
# define LOG_WITH_LEVEL(LEVEL, ...)                                           \
 LOG_WITH_LEVEL_AND_TYPE(LEVEL, DEBUG_TYPE, __VA_ARGS__)

#else
# define LOG_WITH_LEVEL_AND_TYPE(LEVEL, TYPE, ...) do { } while(false)
# define LOG_WITH_LEVEL(LEVEL, ...) do { } while(false)
#endif

/// The current logging level. `LogLevel::NONE` disables all output.
extern LogLevelType DebugFlag;

/// `dbgs()` - The stream used for debugging messages. Defaults to `stderr`.
std::FILE* dbgs();

/// Redirects `dbgs()`. Passing null restores `stderr`.
void setDebugStream(std::FILE* Stream);

#define DEBUG_ONLY(...) DEBUG_WITH_TYPE(DEBUG_TYPE, __VA_ARGS__)

/// Same as `DEBUG_ONLY`, but if the log level is at least `ERROR`.
#define ERROR_ONLY(...) LOG_WITH_LEVEL(ERROR, __VA_ARGS__)
/// Same as `DEBUG_ONLY`, but if the log level is at least `WARN`.
#define WARN_ONLY(...)  LOG_WITH_LEVEL(WARN,  __VA_ARGS__)
/// Same as `DEBUG_ONLY`, but if the log level is at least `INFO`.
#define INFO_ONLY(...)  LOG_WITH_LEVEL(INFO,  __VA_ARGS__)

} // namespace owire
