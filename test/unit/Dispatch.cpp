//===- unit/Dispatch.cpp --------------------------------------------===//
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

#include "Testing.hpp"
#include <owire/Encode/WriteKind.hpp>

using namespace owire;

namespace {

class DispatchTest : public WireTest {};

} // namespace `anonymous`

TEST_F(DispatchTest, NullWinsOverEverything) {
  FieldContext Ctx("f", Color);
  Ctx.withOneOf({"a", "b"}).withPossibleTypes({Point, Circle});
  EXPECT_EQ(classify(Value::Null(), Ctx).Kind, WriteKind::Null);
}

TEST_F(DispatchTest, Strings) {
  FieldContext Ctx("color", &ClassInfo::getString());
  Ctx.withOneOf({"red", "green", "blue"});

  const WriteDecision Green = classify(Value::Str("green"), Ctx);
  EXPECT_EQ(Green.Kind, WriteKind::OneOf);
  EXPECT_EQ(Green.Index, 1u);

  EXPECT_EQ(classify(Value::Str("yellow"), Ctx).Kind, WriteKind::String);
  EXPECT_EQ(classify(Value::Str("red"), FieldContext::Root()).Kind,
            WriteKind::String);
}

TEST_F(DispatchTest, FirstLiteralWins) {
  FieldContext Ctx("s", &ClassInfo::getString());
  Ctx.withOneOf({"x", "y", "x"});
  EXPECT_EQ(classify(Value::Str("x"), Ctx).Index, 0u);
}

TEST_F(DispatchTest, Boxed) {
  const auto Root = FieldContext::Root();
  EXPECT_EQ(classify(Value::Int(1), Root).Kind,      WriteKind::BigInt);
  EXPECT_EQ(classify(Value::Long(1), Root).Kind,     WriteKind::BigLong);
  EXPECT_EQ(classify(Value::Bool(false), Root).Kind, WriteKind::BigBoolean);
  // Boxed values never look at the declared type.
  EXPECT_EQ(classify(Value::Int(1), FieldContext("e", Color)).Kind,
            WriteKind::BigInt);
}

TEST_F(DispatchTest, Arrays) {
  const ClassInfo& IntArr = Config.getArrayClass(ClassInfo::getPrimInt());
  ArrayObject Arr(IntArr, {Value::Int(1)});
  EXPECT_EQ(classify(Value::Of(Arr), FieldContext::Root()).Kind,
            WriteKind::Array);
}

TEST_F(DispatchTest, Enums) {
  const auto Root = FieldContext::Root();
  EXPECT_EQ(classify(Value::Enum(*Color, 0), Root).Kind, WriteKind::Enum);
  EXPECT_EQ(classify(Value::Enum(*OpBody, 1), Root).Kind, WriteKind::Enum);

  // An enum slot routes any object to the enum encoder.
  Object P(*Point, {Value::Int(1), Value::Int(2)});
  EXPECT_EQ(classify(Value::Of(P), FieldContext("e", Color)).Kind,
            WriteKind::Enum);
}

TEST_F(DispatchTest, Objects) {
  Object P(*Point, {Value::Int(1), Value::Int(2)});
  EXPECT_EQ(classify(Value::Of(P), FieldContext::Root()).Kind,
            WriteKind::Object);
  EXPECT_EQ(classify(Value::Of(P), FieldContext("p", Point)).Kind,
            WriteKind::Object);
}

TEST_F(DispatchTest, Headers) {
  FieldContext Ctx("shape", Shape);
  Ctx.withPossibleTypes({Circle, Square});

  EXPECT_EQ(classifyHeader(*Shape, Ctx).Kind, HeaderKind::Typed);

  const HeaderDecision Sq = classifyHeader(*Square, Ctx);
  EXPECT_EQ(Sq.Kind, HeaderKind::PossibleType);
  EXPECT_EQ(Sq.Index, 1u);

  EXPECT_EQ(classifyHeader(*Point, Ctx).Kind, HeaderKind::Object);
  EXPECT_EQ(classifyHeader(*Point, FieldContext::Root()).Kind,
            HeaderKind::Object);
}

TEST_F(DispatchTest, DeclaredTypeBeatsPossibleTypes) {
  FieldContext Ctx("c", Circle);
  Ctx.withPossibleTypes({Square, Circle});
  EXPECT_EQ(classifyHeader(*Circle, Ctx).Kind, HeaderKind::Typed);
}

TEST(WriteKind, Names) {
  EXPECT_EQ(get_write_kind_name(WriteKind::OneOf).str(), "OneOf");
  EXPECT_EQ(get_tag_name(Tag::BigBooleanTrue).str(), "BIG_BOOLEAN_TRUE");
  EXPECT_EQ(get_tag_name(u8(3)).str(), "POSSIBLE_TYPE");
  EXPECT_EQ(get_tag_name(u8(0xF1)).str(), "UNKNOWN");
}
