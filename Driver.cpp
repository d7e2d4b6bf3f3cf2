//===- Driver.cpp ---------------------------------------------------===//
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

#include <Support/Debug.hpp>
#include <Support/Logging.hpp>
#include <owire/Basic/Tags.hpp>
#include <owire/Basic/Value.hpp>
#include <owire/Basic/WireConfig.hpp>
#include <owire/Encode/ObjectWriter.hpp>
#include <owire/Stream/ByteSink.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <optional>
#include <fmt/color.h>
#include <fmt/format.h>

#define DEBUG_TYPE "__DRIVER__"

using namespace owire;

static std::optional<LogLevelType> EnvAsLogLevel(StrRef Env) {
  static constexpr struct {
    const char* Name;
    LogLevelType Level;
  } Levels[] {
    {"NONE",  LogLevel::NONE},
    {"ERROR", LogLevel::ERROR},
    {"WARN",  LogLevel::WARN},
    {"INFO",  LogLevel::INFO},
    {"EXTRA", LogLevel::EXTRA},
  };

  for (const auto& L : Levels) {
    if (Env == StrRef(L.Name))
      return L.Level;
  }
  if (Env.size() == 1 && Env.data()[0] >= '0' && Env.data()[0] <= '4')
    return LogLevelType(Env.data()[0] - '0');
  return std::nullopt;
}

static void HandleLogLevelSetup() {
  const char* Env = std::getenv("OWIRE_LOG_LEVEL");
  if (!Env)
    return;
  if (auto Level = EnvAsLogLevel(Env)) {
    owire::DebugFlag = *Level;
    return;
  }
  fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_yellow),
    "unknown OWIRE_LOG_LEVEL '{}', expected NONE..EXTRA or 0..4.\n", Env);
}

/// Prints the bytes of a stream, 16 per row, with the tag name of each
/// top-level value.
static void DumpBytes(StrRef Title, ArrayRef<u8> Bytes,
                      ArrayRef<usize> Starts) {
  fmt::print(fmt::fg(fmt::terminal_color::bright_blue), "{}:\n", Title);
  usize NextStart = 0;
  for (usize Ix = 0; Ix < Bytes.size(); ++Ix) {
    if (Ix % 16 == 0)
      fmt::print("  {:04x}:", Ix);
    if (NextStart < Starts.size() && Starts[NextStart] == Ix) {
      fmt::print(fmt::fg(fmt::terminal_color::bright_green),
        " {:02X}", Bytes[Ix]);
      ++NextStart;
    } else {
      fmt::print(" {:02X}", Bytes[Ix]);
    }
    if (Ix % 16 == 15 || Ix + 1 == Bytes.size())
      fmt::print("\n");
  }

  for (usize Start : Starts) {
    if (Start < Bytes.size())
      fmt::print("  @{}: {}\n", Start, get_tag_name(Bytes[Start]));
  }
}

int main(int Argc, char* Argv[]) {
  owire::DebugFlag = LogLevel::WARN;
  HandleLogLevelSetup();

  WireConfig Config;
  const ClassInfo& Int = ClassInfo::getPrimInt();
  const ClassInfo& Str = ClassInfo::getString();

  ClassInfo& Color = Config.defineEnum("Color", {"RED", "GREEN", "BLUE"});
  ClassInfo& Point = Config.defineClass("Point");
  Point.addField("x", Int).addField("y", Int);

  ClassInfo& Shape  = Config.defineClass("Shape");
  ClassInfo& Circle = Config.defineClass("Circle", &Shape);
  Circle.addField("center", Point).addField("r", Int);
  ClassInfo& Label  = Config.defineClass("Label", &Shape);
  Label.addField(FieldContext("text", &Str).withOneOf({"origin", "target"}));
  Label.addField("color", Color);

  const ClassInfo& ShapeArr = Config.getArrayClass(Shape);
  ClassInfo& Drawing = Config.defineClass("Drawing");
  Drawing.addField(FieldContext("shapes", &ShapeArr)
    .withPossibleTypes({&Circle, &Label}));
  if (auto E = Config.registerClass(Point)) {
    fmt::print(stderr, "registration failed: {}\n", E);
    return 1;
  }

  Object Center(Point, {Value::Int(10), Value::Int(-3)});
  Object Ring(Circle, {Value::Of(Center), Value::Int(300)});
  Object Tag(Label, {Value::Str("origin"), Value::Enum(Color, 2)});
  Object Note(Label, {Value::Str("a note"), Value::Null()});
  ArrayObject Shapes(ShapeArr,
    {Value::Of(Ring), Value::Of(Tag), Value::Of(Note)});
  Object Doc(Drawing, {Value::Of(Shapes)});

  const Value Roots[] {
    Value::Of(Doc),
    Value::Of(Center),
    Value::Int(42),
    Value::Bool(true),
    Value::Str("done"),
  };

  ObjectWriter W(Config);
  Vec<usize> Starts;
  for (const Value& Root : Roots) {
    Starts.push_back(usize(W.getWritten()));
    if (auto E = W.writeObject(Root)) {
      fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_red),
        "encoding failed: {}\n", E);
      return 1;
    }
  }
  DumpBytes("Drawing", W.getBuffer(), Starts);

  if (Argc > 1) {
    std::FILE* File = std::fopen(Argv[1], "wb");
    if (!File) {
      fmt::print(stderr, "could not open '{}': {}\n",
        Argv[1], std::strerror(errno));
      return 1;
    }

    FileSink Sink(File);
    OwError E = W.resetForReuse(&Sink);
    for (usize Ix = 0; !E && Ix < std::size(Roots); ++Ix)
      E = W.writeObject(Roots[Ix]);
    if (!E)
      E = W.close();
    std::fclose(File);
    if (E) {
      fmt::print(stderr, "writing '{}' failed: {}\n", Argv[1], E);
      return 1;
    }
    LOG_INFO("wrote {} bytes to '{}'.\n", W.getWritten(), Argv[1]);
  }

  fmt::print(fmt::fg(fmt::terminal_color::bright_green),
    "Encoding successful!\n");
  return 0;
}
