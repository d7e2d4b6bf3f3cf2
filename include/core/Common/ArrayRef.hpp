//===- Common/ArrayRef.hpp ------------------------------------------===//
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
#include <Support/ErrorHandle.hpp>
#include <algorithm>
#include <array>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <vector>

namespace owire {

/// ArrayRef - Represent a constant reference to an array (0 or more elements
/// consecutively in memory), i.e. a start pointer and a length.  It allows
/// various APIs to take consecutive elements easily and conveniently.
///
/// This class does not own the underlying data, it is expected to be used in
/// situations where the data resides in some other buffer, whose lifetime
/// extends past that of the ArrayRef. For this reason, it is not in general
/// safe to store an ArrayRef.
///
/// This is intended to be trivially copyable, so it should be passed by
/// value.
template <typename T>
class OWIRE_GSL_POINTER [[nodiscard]] ArrayRef {
public:
  using value_type = T;
  using pointer = value_type *;
  using const_pointer = const value_type *;
  using reference = value_type &;
  using const_reference = const value_type &;
  using iterator = const_pointer;
  using const_iterator = const_pointer;
  using size_type = usize;

private:
  /// The start of the array, in an external buffer.
  const T *Data = nullptr;

  /// The number of elements.
  size_type Length = 0;

public:
  /// @name Constructors
  /// @{

  /// Construct an empty ArrayRef.
  /*implicit*/ ArrayRef() = default;

  /// Construct an ArrayRef from a single element.
  /*implicit*/ ArrayRef(const T &OneElt)
    : Data(&OneElt), Length(1) {}

  /// Construct an ArrayRef from a pointer and length.
  constexpr /*implicit*/ ArrayRef(const T *data, usize length)
    : Data(data), Length(length) {}

  /// Construct an ArrayRef from a range.
  constexpr ArrayRef(const T *begin, const T *end)
      : Data(begin), Length(end - begin) {
    owire_assert(begin <= end);
  }

  /// Construct an ArrayRef from a std::vector.
  template <typename A>
  /*implicit*/ ArrayRef(const std::vector<T, A> &Vec)
    : Data(Vec.data()), Length(Vec.size()) {}

  /// Construct an ArrayRef from a std::array.
  template <usize N>
  /*implicit*/ constexpr ArrayRef(const std::array<T, N> &Arr)
    : Data(Arr.data()), Length(N) {}

  /// Construct an ArrayRef from a C array.
  template <usize N>
  /*implicit*/ constexpr ArrayRef(const T (&Arr)[N]) : Data(Arr), Length(N) {}

  /// Construct an ArrayRef from a std::initializer_list.
  constexpr /*implicit*/ ArrayRef(const std::initializer_list<T> &Vec)
      : Data(Vec.begin() == Vec.end() ? (T *)nullptr : Vec.begin()),
        Length(Vec.size()) {}

  /// @}
  /// @name Simple Operations
  /// @{

  iterator begin() const { return Data; }
  iterator end() const { return Data + Length; }

  /// empty - Check if the array is empty.
  bool empty() const { return Length == 0; }

  const T *data() const { return Data; }

  /// size - Get the array size.
  usize size() const { return Length; }

  /// front - Get the first element.
  const T &front() const {
    owire_assert(!empty());
    return Data[0];
  }

  /// back - Get the last element.
  const T &back() const {
    owire_assert(!empty());
    return Data[Length-1];
  }

  /// equals - Check for element-wise equality.
  bool equals(ArrayRef RHS) const {
    if (Length != RHS.Length)
      return false;
    return std::equal(begin(), end(), RHS.begin());
  }

  /// slice(n, m) - Chop off the first N elements of the array, and keep M
  /// elements in the array.
  ArrayRef<T> slice(usize N, usize M) const {
    owire_assert(N+M <= size(), "Invalid specifier");
    return ArrayRef<T>(data()+N, M);
  }

  /// Drop the first \p N elements of the array.
  ArrayRef<T> drop_front(usize N = 1) const {
    owire_assert(size() >= N, "Dropping more elements than exist");
    return slice(N, size() - N);
  }

  /// Return a copy of *this with only the first \p N elements.
  ArrayRef<T> take_front(usize N = 1) const {
    if (N >= size())
      return *this;
    return slice(0, N);
  }

  /// @}
  /// @name Operator Overloads
  /// @{

  const T &operator[](usize Index) const {
    owire_assert(Index < Length, "Invalid index!");
    return Data[Index];
  }

  /// @}
  /// @name Expensive Operations
  /// @{

  template <typename A = std::allocator<T>>
  std::vector<T, A> vec() const {
    return std::vector<T, A>(Data, Data+Length);
  }

  /// @}
};

template <typename T>
inline bool operator==(ArrayRef<T> LHS, ArrayRef<T> RHS) {
  return LHS.equals(RHS);
}

} // namespace owire
