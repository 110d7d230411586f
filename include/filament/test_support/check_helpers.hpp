// filament/test_support/check_helpers.hpp - Checking pipeline for tests
//
// Runs module resolution, name resolution, model building, type checking
// and discharge on source text, keeping every intermediate result around
// so tests can inspect it.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "filament/mono/monomorphizer.hpp"
#include "filament/mono/specialization_cache.hpp"
#include "filament/sema/check/component_order.hpp"
#include "filament/sema/check/type_checker.hpp"
#include "filament/sema/model/model_builder.hpp"
#include "filament/sema/resolution/module_graph.hpp"
#include "filament/sema/resolution/module_resolver.hpp"
#include "filament/sema/resolution/name_resolver.hpp"
#include "filament/solver/discharge.hpp"
#include "filament/solver/solver_session.hpp"

namespace filament::test_support
{

struct TestCompilation
{
  std::unique_ptr<ModuleGraph> graph = std::make_unique<ModuleGraph>();
  std::unique_ptr<ComponentTable> table = std::make_unique<ComponentTable>();
  DiagnosticBag diags;
  std::unordered_map<const ComponentDef *, CheckedComponent> checked;

  bool resolved = false;  ///< parsing and name resolution succeeded
  bool modeled = false;   ///< model building succeeded
  size_t solver_queries = 0;

  [[nodiscard]] CheckedLookup lookup() const
  {
    return [this](const ComponentDef * def) -> const CheckedComponent * {
      auto it = checked.find(def);
      return it != checked.end() ? &it->second : nullptr;
    };
  }

  [[nodiscard]] const ComponentDef * def(std::string_view name) const { return table->find(name); }

  [[nodiscard]] const CheckedComponent * result(std::string_view name) const
  {
    const ComponentDef * d = def(name);
    if (d == nullptr) return nullptr;
    auto it = checked.find(d);
    return it != checked.end() ? &it->second : nullptr;
  }

  [[nodiscard]] bool ok() const { return resolved && modeled && !diags.has_errors(); }
  [[nodiscard]] bool has(ErrorKind kind) const { return diags.has(kind); }
};

/// Resolve and lower `src` without checking.
[[nodiscard]] inline TestCompilation model_source(
  std::string src, const std::filesystem::path & virtual_path = "/virtual/test.fil")
{
  TestCompilation out;
  ModuleResolver resolver(*out.graph, &out.diags);
  if (!resolver.resolve_source(virtual_path, std::move(src)) || resolver.has_errors()) {
    return out;
  }

  bool names_ok = true;
  for (auto * module : out.graph->modules()) {
    if (module->program == nullptr) continue;
    NameResolver names(out.graph->symbols(), &out.diags);
    names_ok = names.resolve(*module->program) && names_ok;
  }
  out.resolved = names_ok && !out.diags.has_errors();
  if (!out.resolved) {
    return out;
  }

  ModelBuilder builder(*out.table, &out.diags);
  out.modeled = builder.build(*out.graph) && !out.diags.has_errors();
  return out;
}

/// Resolve, lower, check and discharge every component of `src`.
[[nodiscard]] inline TestCompilation check_source(
  std::string src, SolverOptions solver_options = {})
{
  TestCompilation out = model_source(std::move(src));
  if (!out.modeled) {
    return out;
  }

  const ComponentOrder order = compute_component_order(*out.table);
  SolverSession session(std::move(solver_options));
  for (const auto * def : order.flatten()) {
    TypeChecker checker(out.table->pool(), out.lookup(), &out.diags);
    CheckedComponent result = checker.check(*def);
    if (!result.has_errors) {
      Discharger discharger(session, &out.diags);
      (void)discharger.discharge(result);
    }
    out.checked.emplace(def, std::move(result));
  }
  out.solver_queries = session.query_count();
  return out;
}

/// Monomorphize `top` of an already checked compilation.
[[nodiscard]] inline std::optional<MonoProgram> monomorphize(
  TestCompilation & unit, std::string_view top, const std::vector<int64_t> & args,
  SpecializationCache & cache, MonoOptions options = {})
{
  const ComponentDef * def = unit.def(top);
  if (def == nullptr) {
    return std::nullopt;
  }
  Monomorphizer mono(unit.table->pool(), unit.lookup(), cache, &unit.diags, std::move(options));
  return mono.run(*def, args);
}

}  // namespace filament::test_support
