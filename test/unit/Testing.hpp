//===- unit/Testing.hpp ---------------------------------------------===//
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
/// Shared helpers and the sample class model used by the unit tests.
///
//===----------------------------------------------------------------===//

#pragma once

#include <gtest/gtest.h>
#include <core/Common/ArrayRef.hpp>
#include <owire/Basic/Value.hpp>
#include <owire/Basic/WireConfig.hpp>
#include <owire/Encode/ObjectWriter.hpp>
#include <fmt/format.h>
#include <initializer_list>
#include <string_view>
#include <vector>

using Bytes = std::vector<u8>;

inline Bytes toBytes(owire::ArrayRef<u8> Data) {
  return Bytes(Data.begin(), Data.end());
}

/// Concatenates byte sequences.
inline Bytes cat(std::initializer_list<Bytes> Parts) {
  Bytes Out;
  for (const Bytes& P : Parts)
    Out.insert(Out.end(), P.begin(), P.end());
  return Out;
}

/// A short string as written by `writeStringUTF`.
inline Bytes utf(std::string_view S) {
  Bytes Out { static_cast<u8>(S.size()) };
  Out.insert(Out.end(), S.begin(), S.end());
  return Out;
}

/// A class written by name for the first time in a stream.
inline Bytes newClass(std::string_view Name) {
  return cat({Bytes{0x00}, utf(Name)});
}

/// The sample model:
///
///   Point   { int x; int y; }
///   Shape   { }                 Circle : Shape { int r; }
///                               Square : Shape { int side; }
///   Base    { int id; }         Derived : Base { String name; }
///   Palette { String color oneOf(red, green, blue); }
///   Color   enum { RED, GREEN, BLUE }
///   Op      enum { PLUS, MINUS }, with `Op$1` the body of MINUS
///   Holder  { },                with `Holder$1` a malformed constant body
class WireTest : public ::testing::Test {
protected:
  owire::WireConfig Config;

  owire::ClassInfo* Point   = nullptr;
  owire::ClassInfo* Shape   = nullptr;
  owire::ClassInfo* Circle  = nullptr;
  owire::ClassInfo* Square  = nullptr;
  owire::ClassInfo* Base    = nullptr;
  owire::ClassInfo* Derived = nullptr;
  owire::ClassInfo* Palette = nullptr;
  owire::ClassInfo* Color   = nullptr;
  owire::ClassInfo* Op      = nullptr;
  owire::ClassInfo* OpBody  = nullptr;
  owire::ClassInfo* Holder  = nullptr;
  owire::ClassInfo* HolderBody = nullptr;

  explicit WireTest(owire::WireOptions Opts = {}) : Config(Opts) {
    using namespace owire;
    const ClassInfo& Int = ClassInfo::getPrimInt();

    Point = &Config.defineClass("Point");
    Point->addField("x", Int).addField("y", Int);

    Shape  = &Config.defineClass("Shape");
    Circle = &Config.defineClass("Circle", Shape);
    Circle->addField("r", Int);
    Square = &Config.defineClass("Square", Shape);
    Square->addField("side", Int);

    Base = &Config.defineClass("Base");
    Base->addField("id", Int);
    Derived = &Config.defineClass("Derived", Base);
    Derived->addField("name", ClassInfo::getString());

    Palette = &Config.defineClass("Palette");
    Palette->addField(FieldContext("color", &ClassInfo::getString())
      .withOneOf({"red", "green", "blue"}));

    Color = &Config.defineEnum("Color", {"RED", "GREEN", "BLUE"});
    Op = &Config.defineEnum("Op", {"PLUS", "MINUS"});
    OpBody = &Config.defineEnumConstantClass(*Op, "Op$1");

    Holder = &Config.defineClass("Holder");
    HolderBody = &Config.defineEnumConstantClass(*Holder, "Holder$1");
  }

  /// Writes \p Val at the top level of a fresh writer.
  Bytes writeRoot(const owire::Value& Val) {
    owire::ObjectWriter W(Config);
    const owire::OwError Err = W.writeObject(Val);
    EXPECT_FALSE(Err) << fmt::format("{}", Err);
    return toBytes(W.getBuffer());
  }

  /// Writes \p Val at \p Ctx with a fresh writer.
  Bytes writeAt(const owire::Value& Val, const owire::FieldContext& Ctx) {
    owire::ObjectWriter W(Config);
    const owire::OwError Err = W.writeValue(Val, Ctx);
    EXPECT_FALSE(Err) << fmt::format("{}", Err);
    return toBytes(W.getBuffer());
  }
};
