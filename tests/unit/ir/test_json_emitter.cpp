// tests/unit/ir/test_json_emitter.cpp - JSON IR of monomorphized programs
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "filament/ir/json_emitter.hpp"
#include "filament/test_support/check_helpers.hpp"
#include "filament/test_support/parse_helpers.hpp"
#include "filament/test_support/programs.hpp"

using namespace filament;
using filament::test_support::check_source;
using filament::test_support::dump_messages;
using filament::test_support::monomorphize;
using json = nlohmann::json;

namespace
{

MonoProgram worked_example(test_support::TestCompilation & unit, SpecializationCache & cache)
{
  auto program = monomorphize(unit, "Main", {}, cache);
  EXPECT_TRUE(program.has_value()) << dump_messages(unit.diags);
  return program ? std::move(*program) : MonoProgram{};
}

}  // namespace

TEST(IrJsonEmitter, ProgramShape)
{
  auto unit = check_source(std::string(test_support::k_mul_chain));
  ASSERT_TRUE(unit.ok()) << dump_messages(unit.diags);
  SpecializationCache cache;
  const MonoProgram program = worked_example(unit, cache);
  ASSERT_NE(program.entry, nullptr);

  const json j = to_json(program);
  EXPECT_EQ(j["entry"], "Main");
  ASSERT_TRUE(j["components"].is_array());
  ASSERT_EQ(j["components"].size(), 3U);
  EXPECT_EQ(j["components"][2]["name"], "Main");
}

TEST(IrJsonEmitter, ComponentFields)
{
  auto unit = check_source(std::string(test_support::k_mul_chain));
  ASSERT_TRUE(unit.ok()) << dump_messages(unit.diags);
  SpecializationCache cache;
  const MonoProgram program = worked_example(unit, cache);
  const MonoComponent * main = program.find("Main");
  ASSERT_NE(main, nullptr);

  const json j = to_json(*main);
  EXPECT_EQ(j["definition"], "Main");
  EXPECT_EQ(j["extern"], false);
  EXPECT_EQ(j["event"], "G");
  EXPECT_EQ(j["delay"], 22);
  EXPECT_TRUE(j["params"].empty());
  EXPECT_EQ(j["existentials"]["L"], 22);

  // Inputs first, then outputs.
  ASSERT_EQ(j["ports"].size(), 4U);
  EXPECT_EQ(j["ports"][0]["name"], "go");
  EXPECT_EQ(j["ports"][0]["interface"], true);
  EXPECT_TRUE(j["ports"][0]["width"].is_null());
  EXPECT_EQ(j["ports"][3]["name"], "out");
  EXPECT_EQ(j["ports"][3]["direction"], "out");
  EXPECT_EQ(j["ports"][3]["interval"], json::array({22, 23}));
  EXPECT_EQ(j["ports"][3]["width"], 32);

  ASSERT_EQ(j["instances"].size(), 2U);
  EXPECT_EQ(j["instances"][1]["name"], "M3");
  EXPECT_EQ(j["instances"][1]["component"], "Mul_32_3");

  ASSERT_EQ(j["invocations"].size(), 3U);
  EXPECT_EQ(j["invocations"][1]["name"], "m1");
  EXPECT_EQ(j["invocations"][1]["start"], 4);
  EXPECT_EQ(j["invocations"][1]["args"], json::array({"m0.out", "m0.out"}));

  ASSERT_EQ(j["bindings"].size(), 1U);
  EXPECT_EQ(j["bindings"][0]["dst"], "out");
  EXPECT_EQ(j["bindings"][0]["src"], "m2.out");
}

TEST(IrJsonEmitter, ExternSpecialization)
{
  auto unit = check_source(std::string(test_support::k_mul_chain));
  ASSERT_TRUE(unit.ok()) << dump_messages(unit.diags);
  SpecializationCache cache;
  const MonoProgram program = worked_example(unit, cache);
  const MonoComponent * mul = program.find("Mul_32_2");
  ASSERT_NE(mul, nullptr);

  const json j = to_json(*mul);
  EXPECT_EQ(j["extern"], true);
  EXPECT_EQ(j["params"]["W"], 32);
  EXPECT_EQ(j["params"]["M"], 2);
  EXPECT_EQ(j["existentials"]["L"], 4);
  EXPECT_TRUE(j["instances"].empty());
  EXPECT_TRUE(j["invocations"].empty());
}

TEST(IrJsonEmitter, WritesParseableFile)
{
  auto unit = check_source(std::string(test_support::k_mul_chain));
  ASSERT_TRUE(unit.ok()) << dump_messages(unit.diags);
  SpecializationCache cache;
  const MonoProgram program = worked_example(unit, cache);

  const auto dir =
    std::filesystem::temp_directory_path() /
    ("fil_ir_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);

  DiagnosticBag diags;
  ASSERT_TRUE(write_ir_json(program, dir / "Main.json", diags)) << dump_messages(diags);
  std::ifstream in(dir / "Main.json");
  const json parsed = json::parse(in);
  EXPECT_EQ(parsed, to_json(program));

  EXPECT_FALSE(write_ir_json(program, dir / "missing" / "Main.json", diags));
  EXPECT_TRUE(diags.has(ErrorKind::Io));

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
