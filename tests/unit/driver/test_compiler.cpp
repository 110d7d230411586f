// tests/unit/driver/test_compiler.cpp - End-to-end compiler driver
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "filament/driver/compiler.hpp"
#include "filament/test_support/parse_helpers.hpp"
#include "filament/test_support/programs.hpp"

using namespace filament;
using filament::test_support::dump_messages;
using filament::test_support::has_error_containing;
namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  TempDir()
  : path(
      fs::temp_directory_path() /
      ("fil_driver_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
  {
    fs::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  fs::path write(const std::string & rel, const std::string & content) const
  {
    const auto p = path / rel;
    fs::create_directories(p.parent_path());
    std::ofstream out(p);
    out << content;
    return p;
  }
};

const std::string k_sq = std::string(test_support::k_mul_decl) + R"(
comp Sq[W]<G: L>(go: interface[G], a: [G, G+1] W) -> (o: [G+L, G+L+1] W) with {
  exists L;
} where W > 0 {
  M := new Mul[W, 3];
  m := M<G>(a, a);
  o = m.out;
}
)";

const std::string k_broken = std::string(test_support::k_mul_decl) + R"(
comp Bad1<G: 10>(go: interface[G], a: [G, G+1] 16) -> () {
  M := new Mul[32, 2];
  m := M<G>(a, a);
}
comp Bad2<G: 10>(go: interface[G], a: [G, G+1] 16) -> () {
  M := new Mul[32, 2];
  m := M<G>(a, a);
}
)";

CompileOptions check_only()
{
  CompileOptions options;
  options.mode = CompileMode::Check;
  return options;
}

}  // namespace

// ============================================================================
// Check mode
// ============================================================================

TEST(DriverCompiler, ChecksWorkedExample)
{
  const auto result = Compiler::compile_source(
    "/virtual/chain.fil", std::string(test_support::k_mul_chain), check_only());
  ASSERT_TRUE(result.success) << dump_messages(result.diagnostics);
  EXPECT_EQ(result.checked_components, 2U);
  EXPECT_EQ(result.failed_components, 0U);
  EXPECT_GT(result.solver_queries, 0U);
  EXPECT_TRUE(result.generated_files.empty());
  EXPECT_FALSE(result.program.has_value());
  ASSERT_NE(result.components, nullptr);
  EXPECT_NE(result.components->find("Main"), nullptr);
}

TEST(DriverCompiler, CheckingContinuesPastFailures)
{
  const auto result = Compiler::compile_source("/virtual/broken.fil", k_broken, check_only());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.checked_components, 3U);
  EXPECT_EQ(result.failed_components, 2U);
  EXPECT_EQ(result.diagnostics.count(ErrorKind::BitwidthMismatch), 4U)
    << dump_messages(result.diagnostics);
}

TEST(DriverCompiler, FailFastStopsAtFirstFailure)
{
  CompileOptions options = check_only();
  options.fail_fast = true;
  const auto result = Compiler::compile_source("/virtual/broken.fil", k_broken, options);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failed_components, 1U);
  EXPECT_EQ(result.checked_components, 2U);
}

TEST(DriverCompiler, ParallelCheckingMatchesSerial)
{
  CompileOptions options = check_only();
  options.jobs = 4;
  const auto result = Compiler::compile_source("/virtual/broken.fil", k_broken, options);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failed_components, 2U);
  EXPECT_EQ(result.diagnostics.count(ErrorKind::BitwidthMismatch), 4U);
}

TEST(DriverCompiler, SyntaxErrorsStopThePipeline)
{
  const auto result =
    Compiler::compile_source("/virtual/bad.fil", "comp Main<G: 1>(go: interface[G]) -> (", check_only());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has(ErrorKind::Syntax));
  EXPECT_EQ(result.checked_components, 0U);
}

// ============================================================================
// Build mode
// ============================================================================

TEST(DriverCompiler, BuildsAndWritesIr)
{
  TempDir dir;
  CompileOptions options;
  options.top = "Main";
  options.output_dir = dir.path;
  const auto result =
    Compiler::compile_source("/virtual/chain.fil", std::string(test_support::k_mul_chain), options);
  ASSERT_TRUE(result.success) << dump_messages(result.diagnostics);
  ASSERT_TRUE(result.program.has_value());
  EXPECT_EQ(result.program->components.size(), 3U);
  EXPECT_EQ(*result.program->entry->existential("L"), 22);
  ASSERT_EQ(result.generated_files.size(), 1U);
  EXPECT_EQ(result.generated_files[0], dir.path / "chain.json");
  EXPECT_TRUE(fs::exists(dir.path / "chain.json"));
}

TEST(DriverCompiler, TopParameters)
{
  TempDir dir;
  CompileOptions options;
  options.top = "Sq";
  options.output_dir = dir.path;

  auto missing = Compiler::compile_source("/virtual/sq.fil", k_sq, options);
  EXPECT_FALSE(missing.success);
  EXPECT_TRUE(has_error_containing(missing.diagnostics, "missing value for parameter 'W' of top component 'Sq'"))
    << dump_messages(missing.diagnostics);

  options.params["X"] = 1;
  options.params["W"] = 8;
  auto extra = Compiler::compile_source("/virtual/sq.fil", k_sq, options);
  EXPECT_FALSE(extra.success);
  EXPECT_TRUE(has_error_containing(extra.diagnostics, "top component 'Sq' has no parameter 'X'"));

  options.params.erase("X");
  auto ok = Compiler::compile_source("/virtual/sq.fil", k_sq, options);
  ASSERT_TRUE(ok.success) << dump_messages(ok.diagnostics);
  EXPECT_NE(ok.program->find("Sq_8"), nullptr);
  EXPECT_NE(ok.program->find("Mul_8_3"), nullptr);
}

TEST(DriverCompiler, UnknownTopComponent)
{
  TempDir dir;
  CompileOptions options;
  options.output_dir = dir.path;
  const auto result =
    Compiler::compile_source("/virtual/chain.fil", std::string(test_support::k_mul_chain), options);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(has_error_containing(result.diagnostics, "top component 'main' not found"))
    << dump_messages(result.diagnostics);
}

TEST(DriverCompiler, MissingSourceFile)
{
  const auto result = Compiler::compile_single_file("/nonexistent/dir/x.fil", check_only());
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has(ErrorKind::Io));
  EXPECT_TRUE(has_error_containing(result.diagnostics, "file not found"));
}

TEST(DriverCompiler, SingleFileWithImports)
{
  TempDir dir;
  dir.write("lib/mul.fil", std::string(test_support::k_mul_decl));
  const auto main = dir.write("main.fil", R"(
import "./lib/mul.fil";
comp main<G: 4>(go: interface[G], a: [G, G+1] 8) -> (o: [G+4, G+5] 8) {
  M := new Mul[8, 2];
  m := M<G>(a, a);
  o = m.out;
}
)");
  const auto result = Compiler::compile_single_file(main, CompileOptions{});
  ASSERT_TRUE(result.success) << dump_messages(result.diagnostics);
  ASSERT_EQ(result.generated_files.size(), 1U);
  EXPECT_EQ(result.generated_files[0], dir.path / "main.json");
  EXPECT_NE(result.program->find("Mul_8_2"), nullptr);
}

// ============================================================================
// Projects
// ============================================================================

TEST(DriverCompiler, ProjectBuild)
{
  TempDir dir;
  dir.write("src/sq.fil", k_sq);

  ProjectConfig config;
  config.package.name = "squares";
  config.project_root = dir.path;
  config.compiler.entry_points = {"src/sq.fil"};
  config.compiler.top = "Sq";
  config.compiler.params["W"] = 4;
  config.compiler.output_dir = "out";

  const auto result = Compiler::compile_project(config, CompileOptions{});
  ASSERT_TRUE(result.success) << dump_messages(result.diagnostics);
  ASSERT_EQ(result.generated_files.size(), 1U);
  EXPECT_EQ(result.generated_files[0], dir.path / "out" / "Sq.json");
  EXPECT_NE(result.program->find("Sq_4"), nullptr);

  // Command line parameters override the configuration.
  CompileOptions options;
  options.params["W"] = 16;
  const auto overridden = Compiler::compile_project(config, options);
  ASSERT_TRUE(overridden.success) << dump_messages(overridden.diagnostics);
  EXPECT_NE(overridden.program->find("Sq_16"), nullptr);
}

TEST(DriverCompiler, ProjectErrors)
{
  TempDir dir;
  ProjectConfig config;
  config.project_root = dir.path;

  const auto empty = Compiler::compile_project(config, CompileOptions{});
  EXPECT_FALSE(empty.success);
  EXPECT_TRUE(empty.diagnostics.has(ErrorKind::Config));

  config.compiler.entry_points = {"missing.fil"};
  const auto missing = Compiler::compile_project(config, CompileOptions{});
  EXPECT_FALSE(missing.success);
  EXPECT_TRUE(has_error_containing(missing.diagnostics, "entry point not found"));
}
