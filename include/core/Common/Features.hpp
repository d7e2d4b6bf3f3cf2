//===- Common/Features.hpp ------------------------------------------===//
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
/// Compiler attributes and builtins used across objwire.
///
//===----------------------------------------------------------------===//

#pragma once

#include <Config/Config.inc>
#include <cstddef>

#if __cplusplus < 202002L && !defined(_MSVC_LANG)
# error objwire requires C++20.
#endif

#ifdef __has_builtin
# define OWIRE_HAS_BUILTIN(x) __has_builtin(x)
#else
# define OWIRE_HAS_BUILTIN(x) 0
#endif

#ifdef __has_cpp_attribute
# define OWIRE_HAS_CPPATTR(x) __has_cpp_attribute(x)
#else
# define OWIRE_HAS_CPPATTR(x) 0
#endif

//======================================================================//
// Attributes
//======================================================================//

/// Error types are only marked when strict checking is configured.
#if OWIRE_STRICT_NODISCARD
# define OWIRE_NODISCARD [[nodiscard]]
#else
# define OWIRE_NODISCARD
#endif

/// Marks parameters whose referents must outlive the result.
#if OWIRE_HAS_CPPATTR(clang::lifetimebound)
# define OWIRE_LIFETIMEBOUND [[clang::lifetimebound]]
#else
# define OWIRE_LIFETIMEBOUND
#endif

/// Marks non-owning view types.
#if OWIRE_HAS_CPPATTR(gsl::Pointer)
# define OWIRE_GSL_POINTER [[gsl::Pointer]]
#else
# define OWIRE_GSL_POINTER
#endif

#if defined(__clang__) || defined(__GNUC__)
# define OWIRE_READNONE __attribute__((__const__))
# define OWIRE_READONLY __attribute__((__pure__))
#else
# define OWIRE_READNONE
# define OWIRE_READONLY
#endif

//======================================================================//
// Builtins
//======================================================================//

#if defined(__GNUC__)
# define OWIRE_FUNCTION __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
# define OWIRE_FUNCTION __FUNCSIG__
#else
# define OWIRE_FUNCTION __func__
#endif

#if OWIRE_HAS_BUILTIN(__builtin_expect)
# define OWIRE_LIKELY(...)   (__builtin_expect(static_cast<bool>(__VA_ARGS__), 1))
# define OWIRE_UNLIKELY(...) (__builtin_expect(static_cast<bool>(__VA_ARGS__), 0))
#else
# define OWIRE_LIKELY(...)   (static_cast<bool>(__VA_ARGS__))
# define OWIRE_UNLIKELY(...) (static_cast<bool>(__VA_ARGS__))
#endif

#if OWIRE_HAS_BUILTIN(__builtin_unreachable)
# define OWIRE_UNREACHABLE __builtin_unreachable()
#elif defined(_MSC_VER)
# define OWIRE_UNREACHABLE __assume(0)
#endif

#if OWIRE_HAS_BUILTIN(__builtin_trap) || defined(__GNUC__)
# define OWIRE_TRAP __builtin_trap()
#elif defined(_MSC_VER)
# define OWIRE_TRAP __debugbreak()
#else
# define OWIRE_TRAP *(volatile int*)0x11 = 0
#endif

#if OWIRE_HAS_BUILTIN(__builtin_debugtrap)
# define OWIRE_DBGTRAP __builtin_debugtrap()
#elif defined(_MSC_VER)
# define OWIRE_DBGTRAP __debugbreak()
#else
# define OWIRE_DBGTRAP (void(0))
#endif

/// Defines a global constant.
#define OWIRE_CONST inline constexpr
