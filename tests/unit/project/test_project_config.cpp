// tests/unit/project/test_project_config.cpp - fil.yaml parsing and discovery
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "filament/project/project_config.hpp"

using namespace filament;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST(ProjectConfig, FullConfiguration)
{
  const auto r = parse_project_config(R"(
package:
  name: mults
  version: 0.2.0
compiler:
  entry_points: [src/main.fil, src/extra.fil]
  top: Chain
  params:
    W: 32
    N: 4
  output_dir: out
  jobs: 4
  fail_fast: true
solver:
  show_models: true
  timeout_ms: 5000
  dump_queries: queries.smt2
)",
                                      "/proj");
  ASSERT_TRUE(r.success) << r.error;
  const ProjectConfig & c = r.config;
  EXPECT_EQ(c.package.name, "mults");
  EXPECT_EQ(c.package.version, "0.2.0");
  ASSERT_EQ(c.compiler.entry_points.size(), 2U);
  EXPECT_EQ(c.compiler.entry_points[1], fs::path("src/extra.fil"));
  EXPECT_EQ(c.compiler.top, "Chain");
  EXPECT_EQ(c.compiler.params.at("W"), 32);
  EXPECT_EQ(c.compiler.params.at("N"), 4);
  EXPECT_EQ(c.compiler.output_dir, fs::path("out"));
  EXPECT_EQ(c.compiler.jobs, 4U);
  EXPECT_TRUE(c.compiler.fail_fast);
  EXPECT_TRUE(c.solver.show_models);
  EXPECT_EQ(c.solver.timeout_ms, 5000U);
  ASSERT_TRUE(c.solver.dump_queries.has_value());
  EXPECT_EQ(*c.solver.dump_queries, fs::path("/proj") / "queries.smt2");
  EXPECT_EQ(c.project_root, fs::path("/proj"));
}

TEST(ProjectConfig, Defaults)
{
  const auto r = parse_project_config("package:\n  name: empty\n", "/proj");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.compiler.top, "main");
  EXPECT_EQ(r.config.compiler.output_dir, fs::path("build"));
  EXPECT_EQ(r.config.compiler.jobs, 1U);
  EXPECT_TRUE(r.config.compiler.entry_points.empty());
  EXPECT_FALSE(r.config.solver.dump_queries.has_value());

  EXPECT_TRUE(parse_project_config("", "/proj").success);
}

TEST(ProjectConfig, RejectsInvalidValues)
{
  auto r = parse_project_config("compiler:\n  params:\n    W: -1\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "compiler.params.W must be a natural number, got -1");

  r = parse_project_config("compiler:\n  jobs: 0\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "compiler.jobs must be at least 1");

  r = parse_project_config("compiler:\n  entry_points: main.fil\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "compiler.entry_points must be a list");

  r = parse_project_config("- a\n- b\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "top level of the configuration must be a map");
}

TEST(ProjectConfig, MalformedYaml)
{
  const auto r = parse_project_config("compiler: [unclosed\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML", 0), 0U) << r.error;

  const auto typed = parse_project_config("compiler:\n  jobs: many\n", "/proj");
  EXPECT_FALSE(typed.success);
}

TEST(ProjectConfig, LoadAndFindUpward)
{
  const fs::path root = make_temp_dir("fil_config");
  {
    std::ofstream out(root / k_project_config_file_name);
    out << "package:\n  name: found\ncompiler:\n  entry_points: [main.fil]\n";
  }
  fs::create_directories(root / "src" / "deep");

  const auto found = find_project_config(root / "src" / "deep");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(root / k_project_config_file_name));

  const auto r = load_project_config(*found);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "found");
  EXPECT_EQ(fs::canonical(r.config.project_root), fs::canonical(root));

  const auto missing = load_project_config(root / "nope.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("configuration file not found"), std::string::npos);

  std::error_code ec;
  fs::remove_all(root, ec);
}
