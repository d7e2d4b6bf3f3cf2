//===- owire/Encode/ObjectWriter.cpp --------------------------------===//
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
/// This file implements ObjectWriter.
///
//===----------------------------------------------------------------===//

#include "owire/Encode/ObjectWriter.hpp"
#include "owire/Basic/Value.hpp"
#include "owire/Basic/WireConfig.hpp"
#include "owire/Encode/ObjectSerializer.hpp"
#include "owire/Stream/ByteSink.hpp"
#include <core/Support/ErrorHandle.hpp>
#include <core/Support/Logging.hpp>
#include <limits>

#define DEBUG_TYPE "ObjectWriter"

using namespace owire;

void ObjectSerializer::anchor() {}

ObjectWriter::ObjectWriter(const WireConfig& Config) :
 Config(Config),
 Out(Config.getOptions().BufferSize, Config.getOptions().FlushThreshold),
 ClassNames(Config) {
}

ObjectWriter::ObjectWriter(ByteSink& Sink, const WireConfig& Config) :
 ObjectWriter(Config) {
  Out.bind(&Sink);
}

OwError ObjectWriter::checkOpen(const char* Op) const {
  if OWIRE_UNLIKELY(Closed) {
    LOG_ERROR("{} on a closed stream.\n", Op);
    return OwError::CLOSED;
  }
  return OwError::OK;
}

//////////////////////////////////////////////////////////////////////////
// Values

OwError ObjectWriter::writeObject(const Value& Val,
                                  ArrayRef<const ClassInfo*> PossibleTypes) {
  owire_try(this->checkOpen("writeObject"));
  const FieldContext Root = FieldContext::Root(PossibleTypes);
  owire_try(this->encodeValue(Val, Root));
  return Out.flushIfNeeded();
}

OwError ObjectWriter::writeValue(const Value& Val, const FieldContext& Ctx) {
  owire_try(this->checkOpen("writeValue"));
  return this->encodeValue(Val, Ctx);
}

OwError ObjectWriter::encodeValue(const Value& Val, const FieldContext& Ctx) {
  const WriteDecision D = classify(Val, Ctx);
  switch (D.Kind) {
  case WriteKind::Null:
    this->putTag(Tag::Null);
    return OwError::OK;
  case WriteKind::OneOf:
    if OWIRE_UNLIKELY(D.Index >= kMaxOneOfStrings) {
      LOG_ERROR("string index {} of '{}' does not fit in a byte.\n",
        D.Index, Ctx.getName());
      return OwError::kOutOfBounds;
    }
    this->putTag(Tag::OneOf);
    Out.writeByte(static_cast<u8>(D.Index));
    return OwError::OK;
  case WriteKind::String:
    this->putTag(Tag::String);
    Out.writeStringUTF(Val.getStr());
    return OwError::OK;
  case WriteKind::BigInt:
    this->putTag(Tag::BigInt);
    Out.writeCInt(Val.getInt());
    return OwError::OK;
  case WriteKind::BigLong:
    this->putTag(Tag::BigLong);
    Out.writeCLong(Val.getLong());
    return OwError::OK;
  case WriteKind::BigBoolean:
    this->putTag(Val.getBool() ? Tag::BigBooleanTrue : Tag::BigBooleanFalse);
    return OwError::OK;
  case WriteKind::Array:
    this->putTag(Tag::Array);
    return this->writeArray(*Val.getArray(), Ctx);
  case WriteKind::Enum:
    return this->writeEnum(Val, Ctx);
  case WriteKind::Object:
    return this->writeGeneric(Val, Ctx);
  }

  owire_unreachable("invalid WriteKind");
}

OwError ObjectWriter::writeEnum(const Value& Val, const FieldContext& Ctx) {
  const ClassInfo& Runtime = *Val.getClass();
  // Resolve everything before the tag, a failure must not leave a partial
  // value in the stream.
  const ClassInfo* EnumType = Runtime.findEnumType();
  if OWIRE_UNLIKELY(!EnumType) {
    LOG_ERROR("no enum encloses '{}'.\n", Runtime.getName());
    return OwError::kUnrepresentableEnum;
  }
  if OWIRE_UNLIKELY(!Val.isEnum()) {
    LOG_ERROR("'{}' at enum field '{}' is not a constant.\n",
      Runtime.getName(), Ctx.getName());
    return OwError::kTypeMismatch;
  }

  const u32 Ordinal = Val.getOrdinal();
  if OWIRE_UNLIKELY(Ordinal >= EnumType->getEnumConstants().size()) {
    LOG_ERROR("ordinal {} is out of range for '{}'.\n",
      Ordinal, EnumType->getName());
    return OwError::kOutOfBounds;
  }

  this->putTag(Tag::Enum);
  owire_try(this->encodeClass(*EnumType, Ctx));
  Out.writeCInt(static_cast<i32>(Ordinal));
  return OwError::OK;
}

OwError ObjectWriter::writeGeneric(const Value& Val, const FieldContext& Ctx) {
  const Object* Obj = Val.getObject();
  owire_assert(Obj, "only objects reach the generic encoder");

  const ClassInfo& Cls = Obj->getClass();
  if OWIRE_UNLIKELY(Cls.getKind() != ClassKind::Object) {
    LOG_ERROR("object of {} class '{}'.\n",
      get_class_kind_name(Cls.getKind()), Cls.getName());
    return OwError::kTypeMismatch;
  }

  const ClassDescriptor& Desc = Config.resolve(Ctx, Cls);
  owire_try(this->writeObjectHeader(Desc, Ctx));

  if (const ObjectSerializer* Ser = Desc.getSerializer())
    return Ser->writeObject(*this, Val, Desc, Ctx, Out.getWritten());
  return this->writeFields(Val, Desc);
}

OwError ObjectWriter::writeObjectHeader(const ClassDescriptor& Desc,
                                        const FieldContext& Ctx) {
  const HeaderDecision H = classifyHeader(Desc.getClass(), Ctx);
  switch (H.Kind) {
  case HeaderKind::Typed:
    this->putTag(Tag::Typed);
    return OwError::OK;
  case HeaderKind::PossibleType:
    if OWIRE_UNLIKELY(H.Index >= kMaxPossibleTypes) {
      LOG_ERROR("possible type {} of '{}' does not fit in a tag.\n",
        H.Index, Ctx.getName());
      return OwError::kOutOfBounds;
    }
    Out.writeByte(possibleTypeTag(H.Index));
    return OwError::OK;
  case HeaderKind::Object:
    this->putTag(Tag::Object);
    return ClassNames.encodeClass(Out, Desc);
  }

  owire_unreachable("invalid HeaderKind");
}

//////////////////////////////////////////////////////////////////////////
// Default field encoder

OwError ObjectWriter::writeFields(const Value& Val,
                                  const ClassDescriptor& Desc) {
  owire_try(this->checkOpen("writeFields"));
  const Object* Obj = Val.getObject();
  const ClassInfo& Cls = Desc.getClass();
  if OWIRE_UNLIKELY(!Obj || &Obj->getClass() != &Cls) {
    LOG_ERROR("value is not an object of '{}'.\n", Cls.getName());
    return OwError::kTypeMismatch;
  }

  if OWIRE_UNLIKELY(Obj->size() != Cls.getTotalFieldCount()) {
    LOG_ERROR("'{}' has {} fields, the object has {}.\n",
      Cls.getName(), Cls.getTotalFieldCount(), Obj->size());
    return OwError::kTypeMismatch;
  }

  ArrayRef<Value> Remaining = Obj->fields();
  return this->writeFieldsOf(Cls, Remaining);
}

OwError ObjectWriter::writeFieldsOf(const ClassInfo& Cls,
                                    ArrayRef<Value>& Remaining) {
  if (const ClassInfo* Super = Cls.getSuper())
    owire_try(this->writeFieldsOf(*Super, Remaining));

  for (const FieldContext& Field : Cls.fields()) {
    owire_invariant(!Remaining.empty());
    const Value& FieldVal = Remaining.front();
    Remaining = Remaining.drop_front();

    if (Field.isPrimitive())
      owire_try(this->writePrimitive(*Field.getDeclaredType(), FieldVal));
    else
      owire_try(this->encodeValue(FieldVal, Field));
  }

  return OwError::OK;
}

OwError ObjectWriter::writePrimitive(const ClassInfo& Type, const Value& Val) {
  switch (Type.getKind()) {
  case ClassKind::PrimInt:
    if (Val.getKind() != Value::VK_Int)
      break;
    Out.writeCInt(Val.getInt());
    return OwError::OK;
  case ClassKind::PrimLong:
    if (Val.getKind() != Value::VK_Long)
      break;
    Out.writeCLong(Val.getLong());
    return OwError::OK;
  case ClassKind::PrimBool:
    if (Val.getKind() != Value::VK_Bool)
      break;
    Out.writeByte(Val.getBool() ? 1 : 0);
    return OwError::OK;
  default:
    owire_unreachable("not a primitive class");
  }

  LOG_ERROR("expected a value of '{}'.\n", Type.getName());
  return OwError::kTypeMismatch;
}

//////////////////////////////////////////////////////////////////////////
// Arrays

OwError ObjectWriter::writeArray(const ArrayObject& Arr,
                                 const FieldContext& Ctx) {
  owire_try(this->encodeClass(Arr.getClass(), Ctx));

  if OWIRE_UNLIKELY(Arr.size() > usize(std::numeric_limits<i32>::max())) {
    LOG_ERROR("array of {} elements is too long.\n", Arr.size());
    return OwError::kOutOfBounds;
  }
  Out.writeCInt(static_cast<i32>(Arr.size()));
  return this->writeArrayElements(Arr, Ctx);
}

OwError ObjectWriter::writeArrayElements(const ArrayObject& Arr,
                                         const FieldContext& Ctx) {
  const ClassInfo& Component = Arr.getComponent();

  if (Component.isPrimitive()) {
    for (const Value& Elt : Arr.elements())
      owire_try(this->writePrimitive(Component, Elt));
    return OwError::OK;
  }

  if (Component.isArray()) {
    for (const Value& Elt : Arr.elements()) {
      if (Elt.isNull()) {
        owire_try(this->encodeClass(ClassInfo::getObject(), Ctx));
        Out.writeCInt(-1);
        continue;
      }

      const ArrayObject* Sub = Elt.getArray();
      if OWIRE_UNLIKELY(!Sub) {
        LOG_ERROR("element of '{}' is not an array.\n",
          Arr.getClass().getName());
        return OwError::kTypeMismatch;
      }
      owire_try(this->writeArray(*Sub, Ctx));
    }
    return OwError::OK;
  }

  const FieldContext EltCtx = Ctx.forElements(&Component);
  for (const Value& Elt : Arr.elements())
    owire_try(this->encodeValue(Elt, EltCtx));
  return OwError::OK;
}

//////////////////////////////////////////////////////////////////////////
// Primitives

OwError ObjectWriter::writeTag(Tag T) {
  return this->writeByte(static_cast<u8>(T));
}

OwError ObjectWriter::writeByte(u8 Byte) {
  owire_try(this->checkOpen("writeByte"));
  Out.writeByte(Byte);
  return OwError::OK;
}

OwError ObjectWriter::writeCInt(i32 Val) {
  owire_try(this->checkOpen("writeCInt"));
  Out.writeCInt(Val);
  return OwError::OK;
}

OwError ObjectWriter::writeCLong(i64 Val) {
  owire_try(this->checkOpen("writeCLong"));
  Out.writeCLong(Val);
  return OwError::OK;
}

OwError ObjectWriter::writeCShort(u16 Val) {
  owire_try(this->checkOpen("writeCShort"));
  Out.writeCShort(Val);
  return OwError::OK;
}

OwError ObjectWriter::writeStringUTF(StrRef Str) {
  owire_try(this->checkOpen("writeStringUTF"));
  Out.writeStringUTF(Str);
  return OwError::OK;
}

OwError ObjectWriter::writeClass(const ClassInfo& Cls,
                                 const FieldContext& Ctx) {
  owire_try(this->checkOpen("writeClass"));
  return this->encodeClass(Cls, Ctx);
}

OwError ObjectWriter::encodeClass(const ClassInfo& Cls,
                                  const FieldContext& Ctx) {
  return ClassNames.encodeClass(Out, Config.resolve(Ctx, Cls));
}

//////////////////////////////////////////////////////////////////////////
// Lifecycle

OwError ObjectWriter::flush() {
  owire_try(this->checkOpen("flush"));
  return Out.flush();
}

OwError ObjectWriter::close() {
  if (Closed)
    return OwError::OK;
  const OwError Err = Out.flush();
  Closed = true;
  if (Err)
    LOG_ERROR("flush on close failed: {}\n", Err);
  return Err;
}

OwError ObjectWriter::resetForReuse(ByteSink* Sink) {
  owire_try(this->checkOpen("resetForReuse"));
  Out.reset();
  Out.bind(Sink);
  ClassNames.clear();
  LOG_EXTRA("reset, writing to {}.\n", Sink ? "a sink" : "the buffer");
  return OwError::OK;
}

OwError ObjectWriter::resetForReuse(Vec<u8> Storage) {
  owire_try(this->checkOpen("resetForReuse"));
  Out.reset(std::move(Storage));
  Out.bind(nullptr);
  ClassNames.clear();
  LOG_EXTRA("reset, writing to adopted storage.\n");
  return OwError::OK;
}
