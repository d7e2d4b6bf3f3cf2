//===- Common/StrRef.hpp --------------------------------------------===//
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

#pragma once

#include <Common/Fundamental.hpp>
#include <cstring>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace owire {

/// StrRef - Represent a constant reference to a string, i.e. a character
/// array and a length, which need not be null terminated.
///
/// This class does not own the string data, it is expected to be used in
/// situations where the character data resides in some other buffer, whose
/// lifetime extends past that of the StrRef. For this reason, it is not in
/// general safe to store a StrRef.
class OWIRE_GSL_POINTER StrRef {
public:
  static constexpr usize npos = ~usize(0);

  using iterator = const char *;
  using const_iterator = const char *;
  using size_type = usize;
  using value_type = char;

private:
  /// The start of the string, in an external buffer.
  const char *Data = nullptr;

  /// The length of the string.
  usize Length = 0;

  // Workaround memcmp issue with null pointers (undefined behavior)
  // by providing a specialized version
  static int compareMemory(const char *Lhs, const char *Rhs, usize Length) {
    if (Length == 0) { return 0; }
    return ::memcmp(Lhs,Rhs,Length);
  }

public:
  /// @name Constructors
  /// @{

  /// Construct an empty string ref.
  /*implicit*/ StrRef() = default;

  /// Disable conversion from nullptr.  This prevents things like
  /// if (Str == nullptr)
  StrRef(std::nullptr_t) = delete;

  /// Construct a string ref from a cstring.
  /*implicit*/ constexpr StrRef(const char *Str OWIRE_LIFETIMEBOUND)
      : Data(Str), Length(Str ? std::char_traits<char>::length(Str) : 0) {
  }

  /// Construct a string ref from a pointer and length.
  /*implicit*/ constexpr StrRef(const char *data OWIRE_LIFETIMEBOUND,
                                usize length)
      : Data(data), Length(length) {}

  /// Construct a string ref from any std::basic_string.
  template <class A>
  /*implicit*/ StrRef(const std::basic_string<
                        char, std::char_traits<char>, A> &Str)
      : Data(Str.data()), Length(Str.length()) {}

  /// Construct a string ref from an std::string_view.
  /*implicit*/ constexpr StrRef(std::string_view Str)
      : Data(Str.data()), Length(Str.size()) {}

  /// @}
  /// @name Iterators
  /// @{

  iterator begin() const { return data(); }
  iterator end() const { return data() + size(); }

  const unsigned char *bytes_begin() const {
    return reinterpret_cast<const unsigned char *>(begin());
  }
  const unsigned char *bytes_end() const {
    return reinterpret_cast<const unsigned char *>(end());
  }

  /// @}
  /// @name String Operations
  /// @{

  /// data - Get a pointer to the start of the string (which may not be null
  /// terminated).
  [[nodiscard]] constexpr const char *data() const { return Data; }

  /// empty - Check if the string is empty.
  [[nodiscard]] constexpr bool empty() const { return size() == 0; }

  /// size - Get the string size.
  [[nodiscard]] constexpr usize size() const { return Length; }

  /// equals - Check for string equality, this is more efficient than
  /// compare() when the relative ordering of inequal strings isn't needed.
  [[nodiscard]] bool equals(StrRef RHS) const {
    return (Length == RHS.Length &&
            compareMemory(Data, RHS.Data, RHS.Length) == 0);
  }

  /// str - Get the contents as an std::string.
  [[nodiscard]] std::string str() const {
    if (!Data) return std::string();
    return std::string(Data, Length);
  }

  /// @}
  /// @name Type Conversions
  /// @{

  constexpr operator std::string_view() const {
    return std::string_view(data(), size());
  }

  /// @}
};

inline bool operator==(StrRef LHS, StrRef RHS) {
  return LHS.equals(RHS);
}

inline bool operator!=(StrRef LHS, StrRef RHS) { return !(LHS == RHS); }

} // namespace owire

template <>
struct fmt::formatter<owire::StrRef> : fmt::formatter<fmt::string_view> {
  auto format(owire::StrRef S, format_context& Ctx) const {
    return fmt::formatter<fmt::string_view>::format(
      fmt::string_view(S.data(), S.size()), Ctx);
  }
};
