//===- unit/ObjectWriter.cpp ----------------------------------------===//
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
#include <owire/Encode/ObjectSerializer.hpp>
#include <owire/Stream/ByteSink.hpp>
#include <cerrno>
#include <string>

using namespace owire;

namespace {

class ObjectWriterTest : public WireTest {};

/// Writes the first int field of an object, doubled.
class DoublingSerializer final : public ObjectSerializer {
public:
  mutable u64 LastPos = 0;

  OwError writeObject(ObjectWriter& Out, const Value& Val,
                      const ClassDescriptor&, const FieldContext&,
                      u64 StreamPos) const override {
    LastPos = StreamPos;
    return Out.writeCInt(Val.getObject()->fields()[0].getInt() * 2);
  }
};

/// Writes a marker, then the default fields.
class MarkerSerializer final : public ObjectSerializer {
public:
  OwError writeObject(ObjectWriter& Out, const Value& Val,
                      const ClassDescriptor& Desc, const FieldContext&,
                      u64) const override {
    owire_try(Out.writeByte(0x55));
    return Out.writeFields(Val, Desc);
  }
};

class RejectingSerializer final : public ObjectSerializer {
public:
  OwError writeObject(ObjectWriter&, const Value&, const ClassDescriptor&,
                      const FieldContext&, u64) const override {
    return OwError::kTypeMismatch;
  }
};

} // namespace `anonymous`

//////////////////////////////////////////////////////////////////////////
// Headers

TEST_F(ObjectWriterTest, TypedHeader) {
  Object P(*Point, {Value::Int(1), Value::Int(2)});
  EXPECT_EQ(writeAt(Value::Of(P), FieldContext("p", Point)),
            (Bytes{0xFD, 0x01, 0x02}));
}

TEST_F(ObjectWriterTest, PossibleTypeIndex) {
  FieldContext Ctx("shape", Shape);
  Ctx.withPossibleTypes({Circle, Square});

  Object C(*Circle, {Value::Int(3)});
  Object S(*Square, {Value::Int(5)});
  EXPECT_EQ(writeAt(Value::Of(C), Ctx), (Bytes{0x01, 0x03}));
  EXPECT_EQ(writeAt(Value::Of(S), Ctx), (Bytes{0x02, 0x05}));
}

TEST_F(ObjectWriterTest, ObjectHeaderUsesTheClassCache) {
  Object P1(*Point, {Value::Int(1), Value::Int(2)});
  Object P2(*Point, {Value::Int(3), Value::Int(4)});

  ObjectWriter W(Config);
  ASSERT_FALSE(W.writeObject(Value::Of(P1)));
  ASSERT_FALSE(W.writeObject(Value::Of(P2)));

  EXPECT_EQ(toBytes(W.getBuffer()), cat({
    {0x00}, newClass("Point"), {0x01, 0x02},
    {0x00, 0x01}, {0x03, 0x04},
  }));
  EXPECT_EQ(W.getCachedClassCount(), 1u);
  EXPECT_EQ(W.getWritten(), W.getBuffer().size());
}

TEST_F(ObjectWriterTest, PossibleTypeMissFallsBackToObject) {
  FieldContext Ctx("shape", Shape);
  Ctx.withPossibleTypes({Circle});

  Object S(*Square, {Value::Int(5)});
  EXPECT_EQ(writeAt(Value::Of(S), Ctx),
            cat({{0x00}, newClass("Square"), {0x05}}));
}

TEST_F(ObjectWriterTest, RegisteredClassesAreCompact) {
  ASSERT_FALSE(Config.registerClass(*Point));

  Object P(*Point, {Value::Int(1), Value::Int(2)});
  Object S(*Square, {Value::Int(5)});

  ObjectWriter W(Config);
  ASSERT_FALSE(W.writeObject(Value::Of(P)));
  ASSERT_FALSE(W.writeObject(Value::Of(S)));
  ASSERT_FALSE(W.writeObject(Value::Of(S)));

  // Dynamic ids start after the preregistered ones.
  EXPECT_EQ(toBytes(W.getBuffer()), cat({
    {0x00, 0x01, 0x01, 0x02},
    {0x00}, newClass("Square"), {0x05},
    {0x00, 0x02, 0x05},
  }));
}

TEST_F(ObjectWriterTest, TooManyPossibleTypes) {
  Vec<const ClassInfo*> Types(kMaxPossibleTypes, Square);
  Types.push_back(Point);
  FieldContext Ctx("s", Shape);
  Ctx.withPossibleTypes(Types);

  Object P(*Point, {Value::Int(1), Value::Int(2)});
  ObjectWriter W(Config);
  EXPECT_EQ(W.writeValue(Value::Of(P), Ctx), ErrorCode::kOutOfBounds);
}

//////////////////////////////////////////////////////////////////////////
// Specialized encoders

TEST_F(ObjectWriterTest, ClosedStringSet) {
  const FieldContext& Ctx = Palette->fields()[0];
  EXPECT_EQ(writeAt(Value::Str("green"), Ctx), (Bytes{0xEE, 0x01}));
  EXPECT_EQ(writeAt(Value::Str("yellow"), Ctx),
            cat({{0xFC}, utf("yellow")}));
  EXPECT_EQ(writeAt(Value::Str("yellow"), Ctx),
            (Bytes{0xFC, 0x06, 'y', 'e', 'l', 'l', 'o', 'w'}));

  Object P(*Palette, {Value::Str("blue")});
  EXPECT_EQ(writeRoot(Value::Of(P)),
            cat({{0x00}, newClass("Palette"), {0xEE, 0x02}}));
}

TEST_F(ObjectWriterTest, TooManyStrings) {
  std::vector<std::string> Storage;
  Vec<StrRef> Strs;
  for (usize Ix = 0; Ix <= kMaxOneOfStrings; ++Ix)
    Storage.push_back("s" + std::to_string(Ix));
  for (const auto& S : Storage)
    Strs.emplace_back(S);

  FieldContext Ctx("s", &ClassInfo::getString());
  Ctx.withOneOf(Strs);

  ObjectWriter W(Config);
  EXPECT_FALSE(W.writeValue(Value::Str("s254"), Ctx));
  EXPECT_EQ(W.writeValue(Value::Str("s255"), Ctx), ErrorCode::kOutOfBounds);
}

TEST_F(ObjectWriterTest, BoxedPrimitives) {
  EXPECT_EQ(writeRoot(Value::Int(42)),     (Bytes{0xF7, 0x2A}));
  EXPECT_EQ(writeRoot(Value::Int(300)),    (Bytes{0xF7, 0x80, 0x2C, 0x01}));
  EXPECT_EQ(writeRoot(Value::Long(-1)),    (Bytes{0xF6, 0xFF}));
  EXPECT_EQ(writeRoot(Value::Bool(true)),  (Bytes{0xF0}));
  EXPECT_EQ(writeRoot(Value::Bool(false)), (Bytes{0xEF}));
}

TEST_F(ObjectWriterTest, NullShortCircuits) {
  FieldContext Ctx("f", &ClassInfo::getString());
  Ctx.withOneOf({"a"}).withPossibleTypes({Point});
  EXPECT_EQ(writeAt(Value::Null(), Ctx), (Bytes{0xFF}));
  EXPECT_EQ(writeRoot(Value::Null()), (Bytes{0xFF}));
}

//////////////////////////////////////////////////////////////////////////
// Enums

TEST_F(ObjectWriterTest, PlainEnum) {
  EXPECT_EQ(writeRoot(Value::Enum(*Color, 0)),
            cat({{0xFA}, newClass("Color"), {0x00}}));
  EXPECT_EQ(writeRoot(Value::Enum(*Color, 2)),
            cat({{0xFA}, newClass("Color"), {0x02}}));
}

TEST_F(ObjectWriterTest, ConstantWithBody) {
  const Bytes Plain = writeRoot(Value::Enum(*Op, 1));
  const Bytes Body  = writeRoot(Value::Enum(*OpBody, 1));
  EXPECT_EQ(Body, Plain);
  EXPECT_EQ(Body, cat({{0xFA}, newClass("Op"), {0x01}}));

  ObjectWriter W(Config);
  ASSERT_FALSE(W.writeObject(Value::Enum(*Op, 0)));
  ASSERT_FALSE(W.writeObject(Value::Enum(*OpBody, 1)));
  EXPECT_EQ(toBytes(W.getBuffer()), cat({
    {0xFA}, newClass("Op"), {0x00},
    {0xFA, 0x01, 0x01},
  }));
}

TEST_F(ObjectWriterTest, EnumField) {
  ClassInfo& Car = Config.defineClass("Car");
  Car.addField("color", *Color);

  Object C(Car, {Value::Enum(*Color, 1)});
  EXPECT_EQ(writeRoot(Value::Of(C)), cat({
    {0x00}, newClass("Car"),
    {0xFA}, newClass("Color"), {0x01},
  }));
}

TEST_F(ObjectWriterTest, MalformedEnumWritesNothing) {
  ObjectWriter W(Config);
  EXPECT_EQ(W.writeObject(Value::Enum(*HolderBody, 0)),
            ErrorCode::kUnrepresentableEnum);
  EXPECT_EQ(W.getWritten(), 0u);

  Object H(*Holder, Vec<Value>{});
  EXPECT_EQ(W.writeValue(Value::Of(H), FieldContext("e", Color)),
            ErrorCode::kUnrepresentableEnum);
  EXPECT_EQ(W.getWritten(), 0u);
}

TEST_F(ObjectWriterTest, EnumOrdinalOutOfRange) {
  ObjectWriter W(Config);
  EXPECT_EQ(W.writeObject(Value::Enum(*Color, 3)), ErrorCode::kOutOfBounds);
  EXPECT_EQ(W.getWritten(), 0u);
}

//////////////////////////////////////////////////////////////////////////
// Arrays

TEST_F(ObjectWriterTest, PrimitiveArray) {
  const ClassInfo& IntArr = Config.getArrayClass(ClassInfo::getPrimInt());
  ArrayObject Arr(IntArr, {Value::Int(1), Value::Int(300)});
  EXPECT_EQ(writeRoot(Value::Of(Arr)), cat({
    {0xFB}, newClass("int[]"), {0x02},
    {0x01, 0x80, 0x2C, 0x01},
  }));
}

TEST_F(ObjectWriterTest, BoolAndLongArrays) {
  const ClassInfo& BoolArr = Config.getArrayClass(ClassInfo::getPrimBool());
  const ClassInfo& LongArr = Config.getArrayClass(ClassInfo::getPrimLong());
  ArrayObject Bools(BoolArr, {Value::Bool(true), Value::Bool(false)});
  ArrayObject Longs(LongArr, {Value::Long(-2)});

  EXPECT_EQ(writeRoot(Value::Of(Bools)),
            cat({{0xFB}, newClass("boolean[]"), {0x02, 0x01, 0x00}}));
  EXPECT_EQ(writeRoot(Value::Of(Longs)),
            cat({{0xFB}, newClass("long[]"), {0x01, 0xFE}}));
}

TEST_F(ObjectWriterTest, StringArray) {
  const ClassInfo& StrArr = Config.getArrayClass(ClassInfo::getString());
  ArrayObject Arr(StrArr, {Value::Str("a"), Value::Null()});
  EXPECT_EQ(writeRoot(Value::Of(Arr)), cat({
    {0xFB}, newClass("String[]"), {0x02},
    {0xFC}, utf("a"), {0xFF},
  }));
}

TEST_F(ObjectWriterTest, NestedArrays) {
  const ClassInfo& IntArr = Config.getArrayClass(ClassInfo::getPrimInt());
  const ClassInfo& IntArr2 = Config.getArrayClass(IntArr);
  ArrayObject Inner(IntArr, {Value::Int(7)});
  ArrayObject Outer(IntArr2, {Value::Of(Inner), Value::Null()});

  EXPECT_EQ(writeRoot(Value::Of(Outer)), cat({
    {0xFB}, newClass("int[][]"), {0x02},
    newClass("int[]"), {0x01, 0x07},
    newClass("Object"), {0xFF},
  }));
}

TEST_F(ObjectWriterTest, ObjectArrayElementsUseTheComponent) {
  const ClassInfo& PointArr = Config.getArrayClass(*Point);
  Object P(*Point, {Value::Int(1), Value::Int(2)});
  ArrayObject Arr(PointArr, {Value::Of(P), Value::Null()});

  EXPECT_EQ(writeRoot(Value::Of(Arr)), cat({
    {0xFB}, newClass("Point[]"), {0x02},
    {0xFD, 0x01, 0x02}, {0xFF},
  }));
}

TEST_F(ObjectWriterTest, ArrayElementsInheritPossibleTypes) {
  const ClassInfo& ShapeArr = Config.getArrayClass(*Shape);
  Object C(*Circle, {Value::Int(3)});
  Object S(*Square, {Value::Int(4)});
  ArrayObject Arr(ShapeArr, {Value::Of(C), Value::Of(S)});

  ObjectWriter W(Config);
  ASSERT_FALSE(W.writeObject(Value::Of(Arr), {Circle, Square}));
  EXPECT_EQ(toBytes(W.getBuffer()), cat({
    {0xFB}, newClass("Shape[]"), {0x02},
    {0x01, 0x03}, {0x02, 0x04},
  }));
}

TEST_F(ObjectWriterTest, ArrayElementMismatch) {
  const ClassInfo& IntArr = Config.getArrayClass(ClassInfo::getPrimInt());
  ArrayObject Arr(IntArr, {Value::Str("1")});
  ObjectWriter W(Config);
  EXPECT_EQ(W.writeObject(Value::Of(Arr)), ErrorCode::kTypeMismatch);
}

//////////////////////////////////////////////////////////////////////////
// Default and custom encoders

TEST_F(ObjectWriterTest, DefaultEncoderWritesInheritedFieldsFirst) {
  Object D(*Derived, {Value::Int(7), Value::Str("x")});
  EXPECT_EQ(writeRoot(Value::Of(D)), cat({
    {0x00}, newClass("Derived"),
    {0x07}, {0xFC}, utf("x"),
  }));
}

TEST_F(ObjectWriterTest, DefaultEncoderPrimitives) {
  ClassInfo& Flags = Config.defineClass("Flags");
  Flags.addField("on", ClassInfo::getPrimBool())
       .addField("big", ClassInfo::getPrimLong());

  Object F(Flags, {Value::Bool(true), Value::Long(300)});
  EXPECT_EQ(writeRoot(Value::Of(F)), cat({
    {0x00}, newClass("Flags"),
    {0x01}, {0x80, 0x2C, 0x01},
  }));
}

TEST_F(ObjectWriterTest, DefaultEncoderMismatches) {
  ObjectWriter W(Config);
  Object Short(*Derived, {Value::Int(7)});
  EXPECT_EQ(W.writeObject(Value::Of(Short)), ErrorCode::kTypeMismatch);

  Object Wrong(*Point, {Value::Str("a"), Value::Int(1)});
  EXPECT_EQ(W.writeObject(Value::Of(Wrong)), ErrorCode::kTypeMismatch);
}

TEST_F(ObjectWriterTest, CustomSerializer) {
  ClassInfo& Temp = Config.defineClass("Temp");
  Temp.addField("v", ClassInfo::getPrimInt());

  auto Ser = std::make_unique<DoublingSerializer>();
  const DoublingSerializer* Raw = Ser.get();
  ASSERT_FALSE(Config.registerSerializer(Temp, std::move(Ser)));

  Object T(Temp, {Value::Int(21)});
  EXPECT_EQ(writeRoot(Value::Of(T)),
            cat({{0x00}, newClass("Temp"), {0x2A}}));
  // Header: tag, name marker, length, "Temp".
  EXPECT_EQ(Raw->LastPos, 7u);
}

TEST_F(ObjectWriterTest, SerializerForSubclasses) {
  ASSERT_FALSE(Config.registerSerializer(
    *Base, std::make_unique<MarkerSerializer>(), true));
  ASSERT_FALSE(Config.registerSerializer(
    *Shape, std::make_unique<RejectingSerializer>()));

  Object D(*Derived, {Value::Int(7), Value::Str("x")});
  EXPECT_EQ(writeRoot(Value::Of(D)), cat({
    {0x00}, newClass("Derived"),
    {0x55}, {0x07}, {0xFC}, utf("x"),
  }));

  // Registered without subclasses, so circles use the default encoder.
  Object C(*Circle, {Value::Int(3)});
  EXPECT_EQ(writeRoot(Value::Of(C)),
            cat({{0x00}, newClass("Circle"), {0x03}}));
}

TEST_F(ObjectWriterTest, SerializerErrorsPropagate) {
  ASSERT_FALSE(Config.registerSerializer(
    *Point, std::make_unique<RejectingSerializer>()));
  Object P(*Point, {Value::Int(1), Value::Int(2)});
  ObjectWriter W(Config);
  EXPECT_EQ(W.writeObject(Value::Of(P)), ErrorCode::kTypeMismatch);
}

//////////////////////////////////////////////////////////////////////////
// Lifecycle

namespace {

OwError writeSequence(ObjectWriter& W, const Object& P1, const Object& P2,
                      const ClassInfo& Color) {
  owire_try(W.writeObject(Value::Of(P1)));
  owire_try(W.writeObject(Value::Enum(Color, 1)));
  owire_try(W.writeObject(Value::Of(P2)));
  owire_try(W.writeObject(Value::Str("s")));
  return OwError::OK;
}

} // namespace `anonymous`

TEST_F(ObjectWriterTest, ResetMatchesAFreshWriter) {
  Object P1(*Point, {Value::Int(1), Value::Int(2)});
  Object P2(*Point, {Value::Int(3), Value::Int(4)});

  ObjectWriter Fresh(Config);
  ASSERT_FALSE(writeSequence(Fresh, P1, P2, *Color));

  ObjectWriter Reused(Config);
  ASSERT_FALSE(writeSequence(Reused, P1, P2, *Color));
  ASSERT_FALSE(writeSequence(Reused, P1, P2, *Color));
  ASSERT_FALSE(Reused.resetForReuse());
  EXPECT_EQ(Reused.getWritten(), 0u);
  EXPECT_EQ(Reused.getCachedClassCount(), 0u);
  ASSERT_FALSE(writeSequence(Reused, P1, P2, *Color));

  EXPECT_EQ(toBytes(Reused.getBuffer()), toBytes(Fresh.getBuffer()));
  EXPECT_EQ(Reused.getWritten(), Fresh.getWritten());
}

TEST_F(ObjectWriterTest, ResetWithStorage) {
  Object P1(*Point, {Value::Int(1), Value::Int(2)});
  Object P2(*Point, {Value::Int(3), Value::Int(4)});

  ObjectWriter Fresh(Config);
  ASSERT_FALSE(writeSequence(Fresh, P1, P2, *Color));

  ObjectWriter Reused(Config);
  ASSERT_FALSE(writeSequence(Reused, P1, P2, *Color));
  ASSERT_FALSE(Reused.resetForReuse(Vec<u8>{0xAA, 0xBB}));
  ASSERT_FALSE(writeSequence(Reused, P1, P2, *Color));

  EXPECT_EQ(Reused.getCopyOfWrittenBuffer(), Fresh.getCopyOfWrittenBuffer());
}

TEST_F(ObjectWriterTest, ResetToSink) {
  Object P1(*Point, {Value::Int(1), Value::Int(2)});
  Object P2(*Point, {Value::Int(3), Value::Int(4)});

  ObjectWriter Fresh(Config);
  ASSERT_FALSE(writeSequence(Fresh, P1, P2, *Color));

  Vec<u8> Data;
  VecSink Sink(Data);
  ObjectWriter Reused(Config);
  ASSERT_FALSE(writeSequence(Reused, P1, P2, *Color));
  ASSERT_FALSE(Reused.resetForReuse(&Sink));
  ASSERT_FALSE(writeSequence(Reused, P1, P2, *Color));
  ASSERT_FALSE(Reused.flush());

  EXPECT_EQ(toBytes(Data), toBytes(Fresh.getBuffer()));
  EXPECT_EQ(Reused.getWritten(), Fresh.getWritten());
}

TEST_F(ObjectWriterTest, ClosedStream) {
  Object P(*Point, {Value::Int(1), Value::Int(2)});
  ObjectWriter W(Config);
  ASSERT_FALSE(W.writeObject(Value::Of(P)));
  ASSERT_FALSE(W.close());
  EXPECT_TRUE(W.isClosed());

  const u64 Written = W.getWritten();
  EXPECT_EQ(W.writeObject(Value::Of(P)), ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeObject(Value::Null()), ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeValue(Value::Int(1), FieldContext::Root()),
            ErrorCode::kClosedStream);
  EXPECT_EQ(W.flush(), ErrorCode::kClosedStream);
  EXPECT_EQ(W.getWritten(), Written);

  const FieldContext Root = FieldContext::Root();
  EXPECT_EQ(W.writeFields(Value::Of(P), Config.resolve(Root, *Point)),
            ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeClass(*Point, Root), ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeTag(Tag::Null), ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeByte(1), ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeCInt(300), ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeCLong(1), ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeCShort(7), ErrorCode::kClosedStream);
  EXPECT_EQ(W.writeStringUTF("x"), ErrorCode::kClosedStream);
  EXPECT_EQ(W.getWritten(), Written);

  EXPECT_EQ(W.resetForReuse(), ErrorCode::kClosedStream);
  EXPECT_EQ(W.resetForReuse(Vec<u8>{}), ErrorCode::kClosedStream);
  EXPECT_EQ(W.getWritten(), Written);

  EXPECT_FALSE(W.close());
}

//////////////////////////////////////////////////////////////////////////
// Sinks

namespace {

class FailingSink final : public ByteSink {
public:
  OwError write(ArrayRef<u8>) override { return OwError::Sink(ENOSPC); }
};

class EagerSinkTest : public WireTest {
protected:
  EagerSinkTest() : WireTest(WireOptions{4096, 0}) {}
};

} // namespace `anonymous`

TEST_F(ObjectWriterTest, SinkFlushesOnClose) {
  Vec<u8> Data;
  VecSink Sink(Data);
  ObjectWriter W(Sink, Config);

  ASSERT_FALSE(W.writeObject(Value::Int(42)));
  EXPECT_TRUE(Data.empty());
  ASSERT_FALSE(W.close());
  EXPECT_EQ(toBytes(Data), (Bytes{0xF7, 0x2A}));
  EXPECT_EQ(W.getWritten(), 2u);
}

TEST_F(EagerSinkTest, SinkFlushesPastThreshold) {
  Vec<u8> Data;
  VecSink Sink(Data);
  ObjectWriter W(Sink, Config);

  ASSERT_FALSE(W.writeObject(Value::Int(42)));
  EXPECT_EQ(toBytes(Data), (Bytes{0xF7, 0x2A}));
  EXPECT_TRUE(W.getBuffer().empty());

  ASSERT_FALSE(W.writeObject(Value::Bool(true)));
  EXPECT_EQ(toBytes(Data), (Bytes{0xF7, 0x2A, 0xF0}));
  EXPECT_EQ(W.getWritten(), 3u);
}

TEST_F(EagerSinkTest, SinkErrorsPropagate) {
  FailingSink Sink;
  ObjectWriter W(Sink, Config);
  const OwError Err = W.writeObject(Value::Int(42));
  EXPECT_EQ(Err, ErrorCode::kSinkError);
  EXPECT_EQ(Err.extra(), u32(ENOSPC));
}

TEST_F(ObjectWriterTest, SinkErrorOnCloseStillCloses) {
  FailingSink Sink;
  ObjectWriter W(Sink, Config);
  ASSERT_FALSE(W.writeObject(Value::Int(42)));
  EXPECT_EQ(W.close(), ErrorCode::kSinkError);
  EXPECT_TRUE(W.isClosed());
}
