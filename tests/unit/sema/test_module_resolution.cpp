// tests/unit/sema/test_module_resolution.cpp - Unit tests for import resolution
//
// Every test writes its modules into a private temporary directory.
//

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "filament/basic/diagnostic.hpp"
#include "filament/sema/resolution/module_graph.hpp"
#include "filament/sema/resolution/module_resolver.hpp"
#include "filament/test_support/parse_helpers.hpp"

using namespace filament;
using filament::test_support::dump_messages;
using filament::test_support::has_error_containing;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(
      std::filesystem::temp_directory_path() /
      (name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  std::filesystem::path write(const std::string & rel, const std::string & content) const
  {
    const auto p = path / rel;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p);
    out << content;
    return p;
  }
};

constexpr const char * k_reg = R"(
extern comp Reg[W]<G: 1>(go: interface[G], in: [G, G+1] W) -> (out: [G+1, G+2] W) where W > 0;
)";

}  // namespace

TEST(SemaModuleResolution, LoadsImportsOnce)
{
  TempDir dir("fil_mod_basic");
  dir.write("lib/reg.fil", k_reg);
  dir.write("lib/pipe.fil", R"(import "./reg.fil";
comp Pipe<G: 1>(go: interface[G], a: [G, G+1] 8) -> (o: [G+1, G+2] 8) {
  R := new Reg[8];
  r := R<G>(a);
  o = r.out;
}
)");
  const auto main_path = dir.write("main.fil", R"(import "./lib/reg.fil";
import "./lib/pipe.fil";
comp main<G: 1>(go: interface[G], a: [G, G+1] 8) -> (o: [G+1, G+2] 8) {
  P := new Pipe;
  p := P<G>(a);
  o = p.o;
}
)");

  ModuleGraph graph;
  DiagnosticBag diags;
  ModuleResolver resolver(graph, &diags);
  ASSERT_TRUE(resolver.resolve(main_path)) << dump_messages(diags);
  EXPECT_FALSE(resolver.has_errors()) << dump_messages(diags);

  // main, reg and pipe; reg is parsed once although imported twice.
  EXPECT_EQ(graph.size(), 3U);
  ModuleInfo * main_mod = graph.entry();
  ASSERT_NE(main_mod, nullptr);
  ASSERT_EQ(main_mod->imports.size(), 2U);
  EXPECT_EQ(main_mod->imports[1]->imports.size(), 1U);
  EXPECT_EQ(main_mod->imports[0], main_mod->imports[1]->imports[0]);

  EXPECT_NE(graph.symbols().get_global_scope()->lookup("Reg"), nullptr);
  EXPECT_NE(graph.symbols().get_global_scope()->lookup("Pipe"), nullptr);
}

TEST(SemaModuleResolution, CyclicImportNamesTheChain)
{
  TempDir dir("fil_mod_cycle");
  dir.write("b.fil", "import \"./a.fil\";\n");
  const auto a = dir.write("a.fil", "import \"./b.fil\";\n");

  ModuleGraph graph;
  DiagnosticBag diags;
  ModuleResolver resolver(graph, &diags);
  (void)resolver.resolve(a);

  EXPECT_TRUE(resolver.has_errors());
  EXPECT_TRUE(diags.has(ErrorKind::CyclicImport)) << dump_messages(diags);
  EXPECT_TRUE(has_error_containing(diags, "cyclic import: a.fil -> b.fil -> a.fil"))
    << dump_messages(diags);
}

TEST(SemaModuleResolution, SelfImportIsACycle)
{
  TempDir dir("fil_mod_self");
  const auto a = dir.write("a.fil", "import \"./a.fil\";\n");

  ModuleGraph graph;
  DiagnosticBag diags;
  ModuleResolver resolver(graph, &diags);
  (void)resolver.resolve(a);
  EXPECT_TRUE(diags.has(ErrorKind::CyclicImport));
}

TEST(SemaModuleResolution, MissingImport)
{
  TempDir dir("fil_mod_missing");
  const auto a = dir.write("a.fil", "import \"./nowhere.fil\";\n");

  ModuleGraph graph;
  DiagnosticBag diags;
  ModuleResolver resolver(graph, &diags);
  EXPECT_TRUE(resolver.resolve(a));
  EXPECT_TRUE(diags.has(ErrorKind::Io));
  EXPECT_TRUE(has_error_containing(diags, "imported file not found"));
}

TEST(SemaModuleResolution, ImportPathRules)
{
  TempDir dir("fil_mod_rules");
  const auto a = dir.write("a.fil", "import \"/etc/abs.fil\";\nimport \"./noext\";\n");

  ModuleGraph graph;
  DiagnosticBag diags;
  ModuleResolver resolver(graph, &diags);
  (void)resolver.resolve(a);
  EXPECT_TRUE(has_error_containing(diags, "absolute import paths are not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "import path must have a file extension"));
}

TEST(SemaModuleResolution, MissingEntryFile)
{
  ModuleGraph graph;
  DiagnosticBag diags;
  ModuleResolver resolver(graph, &diags);
  EXPECT_FALSE(resolver.resolve("/definitely/not/here.fil"));
  EXPECT_TRUE(has_error_containing(diags, "file not found"));
}

TEST(SemaModuleResolution, DuplicateComponentAcrossModules)
{
  TempDir dir("fil_mod_dup");
  dir.write("reg.fil", k_reg);
  const auto main_path = dir.write("main.fil", std::string("import \"./reg.fil\";\n") + k_reg);

  ModuleGraph graph;
  DiagnosticBag diags;
  ModuleResolver resolver(graph, &diags);
  (void)resolver.resolve(main_path);
  EXPECT_TRUE(diags.has(ErrorKind::DuplicateDefinition)) << dump_messages(diags);
  EXPECT_TRUE(has_error_containing(diags, "'Reg' is already defined"));
}

TEST(SemaModuleResolution, InMemoryEntryReadsImportsFromDisk)
{
  TempDir dir("fil_mod_mem");
  dir.write("reg.fil", k_reg);

  ModuleGraph graph;
  DiagnosticBag diags;
  ModuleResolver resolver(graph, &diags);
  ASSERT_TRUE(resolver.resolve_source(dir.path / "virtual.fil", "import \"./reg.fil\";\n"));
  EXPECT_FALSE(resolver.has_errors()) << dump_messages(diags);
  EXPECT_EQ(graph.size(), 2U);
}
