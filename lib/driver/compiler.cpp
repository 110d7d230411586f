// filament/driver/compiler.cpp - Compiler driver implementation
//
#include "filament/driver/compiler.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "filament/ir/json_emitter.hpp"
#include "filament/mono/lift.hpp"
#include "filament/mono/monomorphizer.hpp"
#include "filament/mono/specialization_cache.hpp"
#include "filament/sema/check/component_order.hpp"
#include "filament/sema/check/type_checker.hpp"
#include "filament/sema/model/model_builder.hpp"
#include "filament/sema/resolution/module_resolver.hpp"
#include "filament/sema/resolution/name_resolver.hpp"
#include "filament/solver/discharge.hpp"
#include "filament/solver/solver_session.hpp"

namespace filament
{

namespace
{

namespace fs = std::filesystem;

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

/// Result of checking one component in isolation.
struct ComponentOutcome
{
  CheckedComponent checked;
  DiagnosticBag diags;
  std::string log;
  size_t queries = 0;
  bool ok = false;
};

/**
 * State of one compiler invocation after module loading: the semantic
 * model, check results and the specialization cache. Created per
 * compilation and discarded with it.
 */
class CompilationSession
{
public:
  CompilationSession(CompileResult & result, const CompileOptions & options)
  : result_(result), options_(options)
  {
  }

  /// Name resolution, model building, checking and discharge.
  bool analyze();

  /// Monomorphize `top`, verify the result and write the IR to `output_path`.
  bool build(const std::string & top, const fs::path & output_path);

private:
  bool resolve_names();
  bool build_model();
  bool check_components();

  ComponentOutcome check_one(const ComponentDef & def) const;

  /// Record an outcome; false if checking should stop.
  bool commit(const ComponentDef & def, ComponentOutcome && outcome);

  std::optional<std::vector<int64_t>> entry_arguments(const ComponentDef & top);

  bool verify(const MonoProgram & program);

  [[nodiscard]] SolverOptions solver_options() const;

  void log(const std::string & line) const
  {
    if (options_.verbose) {
      std::cerr << line << "\n";
    }
  }

  CompileResult & result_;
  const CompileOptions & options_;

  std::unordered_map<const ComponentDef *, CheckedComponent> checked_;
  SpecializationCache cache_;
};

SolverOptions CompilationSession::solver_options() const
{
  SolverOptions so;
  so.show_models = options_.show_models;
  so.timeout_ms = options_.timeout_ms;
  if (options_.dump_queries) {
    so.dump_queries = options_.dump_queries->string();
  }
  return so;
}

bool CompilationSession::analyze()
{
  if (!resolve_names()) {
    return false;
  }
  if (!build_model()) {
    return false;
  }
  return check_components();
}

bool CompilationSession::resolve_names()
{
  ModuleGraph & graph = *result_.module_graph;
  bool success = true;
  for (auto * module : graph.modules()) {
    if (module->program == nullptr) {
      continue;
    }
    NameResolver resolver(graph.symbols(), &result_.diagnostics);
    if (!resolver.resolve(*module->program)) {
      success = false;
    }
  }
  log("[resolve] " + std::to_string(graph.size()) + " module(s)");
  return success && !result_.diagnostics.has_errors();
}

bool CompilationSession::build_model()
{
  result_.components = std::make_unique<ComponentTable>();
  ModelBuilder builder(*result_.components, &result_.diagnostics);
  const bool ok = builder.build(*result_.module_graph);
  log("[model] " + std::to_string(result_.components->size()) + " component(s)");
  return ok && !result_.diagnostics.has_errors();
}

// ============================================================================
// Checking
// ============================================================================

bool CompilationSession::check_components()
{
  const ComponentOrder order = compute_component_order(*result_.components);
  for (const auto * def : order.flatten()) {
    if (order.recursive.count(def) != 0) {
      log("[check] " + std::string(def->name) + " is recursive; callers see its signature only");
    }
  }

  const size_t jobs = std::max<size_t>(options_.jobs, 1);
  for (size_t lv = 0; lv < order.levels.size(); ++lv) {
    const auto & level = order.levels[lv];
    log(
      "[check] level " + std::to_string(lv) + ": " + std::to_string(level.size()) +
      " component(s)");

    if (jobs == 1 || level.size() == 1) {
      for (const auto * def : level) {
        if (!commit(*def, check_one(*def))) {
          return false;
        }
      }
      continue;
    }

    // Components of one level only depend on lower levels, which are
    // complete, so they can be checked concurrently.
    std::vector<ComponentOutcome> outcomes(level.size());
    for (size_t start = 0; start < level.size(); start += jobs) {
      const size_t end = std::min(start + jobs, level.size());
      std::vector<std::future<ComponentOutcome>> pending;
      pending.reserve(end - start);
      for (size_t i = start; i < end; ++i) {
        const ComponentDef * def = level[i];
        pending.push_back(
          std::async(std::launch::async, [this, def]() { return check_one(*def); }));
      }
      for (size_t i = start; i < end; ++i) {
        outcomes[i] = pending[i - start].get();
      }
    }
    for (size_t i = 0; i < level.size(); ++i) {
      if (!commit(*level[i], std::move(outcomes[i]))) {
        return false;
      }
    }
  }

  log(
    "[check] " + std::to_string(result_.checked_components) + " checked, " +
    std::to_string(result_.failed_components) + " failed, " +
    std::to_string(result_.solver_queries) + " solver queries");
  return result_.failed_components == 0;
}

ComponentOutcome CompilationSession::check_one(const ComponentDef & def) const
{
  ComponentOutcome out;
  std::ostringstream log;
  std::ostream * log_ptr = options_.verbose ? &log : nullptr;

  const CheckedLookup lookup = [this](const ComponentDef * callee) -> const CheckedComponent * {
    auto it = checked_.find(callee);
    return it != checked_.end() ? &it->second : nullptr;
  };

  TypeChecker checker(result_.components->pool(), lookup, &out.diags);
  out.checked = checker.check(def);

  if (out.checked.has_errors) {
    if (log_ptr != nullptr) {
      log << "[check] " << def.name << ": " << checker.error_count()
          << " error(s); obligations not discharged\n";
    }
    out.ok = false;
  } else {
    SolverSession session(solver_options());
    Discharger discharger(session, &out.diags, log_ptr);
    out.ok = discharger.discharge(out.checked);
    out.queries = session.query_count();
  }

  out.log = log.str();
  return out;
}

bool CompilationSession::commit(const ComponentDef & def, ComponentOutcome && outcome)
{
  if (options_.verbose && !outcome.log.empty()) {
    std::cerr << outcome.log;
  }
  result_.diagnostics.merge(std::move(outcome.diags));
  result_.solver_queries += outcome.queries;
  result_.checked_components++;
  const bool ok = outcome.ok;
  if (!ok) {
    result_.failed_components++;
  }
  checked_.emplace(&def, std::move(outcome.checked));

  if (!ok && options_.fail_fast) {
    log("[check] stopping after " + quote_name(def.name) + " (fail-fast)");
    return false;
  }
  return true;
}

// ============================================================================
// Build
// ============================================================================

std::optional<std::vector<int64_t>> CompilationSession::entry_arguments(const ComponentDef & top)
{
  std::vector<int64_t> args;
  bool ok = true;
  for (const auto p : top.params) {
    auto it = options_.params.find(std::string(p));
    if (it != options_.params.end()) {
      args.push_back(it->second);
      continue;
    }
    result_.diagnostics
      .report(
        ErrorKind::ArgumentCount, top.range,
        "missing value for parameter " + quote_name(p) + " of top component " + quote_name(top.name))
      .with_help("pass --param " + std::string(p) + "=<value>");
    ok = false;
  }
  for (const auto & [name, value] : options_.params) {
    if (std::find(top.params.begin(), top.params.end(), name) == top.params.end()) {
      result_.diagnostics.report(
        ErrorKind::ArgumentCount, top.range,
        "top component " + quote_name(top.name) + " has no parameter " + quote_name(name));
      ok = false;
    }
  }
  if (!ok) {
    return std::nullopt;
  }
  return args;
}

bool CompilationSession::build(const std::string & top_name, const fs::path & output_path)
{
  const ComponentDef * top = result_.components->find(top_name);
  if (top == nullptr) {
    std::string names;
    for (const auto & def : result_.components->components()) {
      if (!names.empty()) names += ", ";
      names += std::string(def->name);
    }
    auto builder = result_.diagnostics.report(
      ErrorKind::UnboundIdentifier, SourceRange{}, "top component " + quote_name(top_name) + " not found");
    if (!names.empty()) {
      builder.with_note("available components: " + names);
    }
    builder.with_help("select one with --top NAME");
    return false;
  }

  const auto args = entry_arguments(*top);
  if (!args) {
    return false;
  }

  const CheckedLookup lookup = [this](const ComponentDef * def) -> const CheckedComponent * {
    auto it = checked_.find(def);
    return it != checked_.end() ? &it->second : nullptr;
  };

  MonoOptions mono_options;
  mono_options.jobs = std::max<size_t>(options_.jobs, 1);
  mono_options.solver = solver_options();

  Monomorphizer mono(
    result_.components->pool(), lookup, cache_, &result_.diagnostics, mono_options,
    options_.verbose ? &std::cerr : nullptr);
  std::optional<MonoProgram> program = mono.run(*top, *args);
  result_.solver_queries += mono.solver_queries();
  if (!program) {
    return false;
  }
  log(
    "[mono] " + std::to_string(program->components.size()) + " specialization(s), entry " +
    program->entry->name);

  if (!verify(*program)) {
    return false;
  }

  if (!write_ir_json(*program, output_path, result_.diagnostics)) {
    return false;
  }
  result_.generated_files.push_back(output_path);
  result_.program = std::move(program);
  return true;
}

bool CompilationSession::verify(const MonoProgram & program)
{
  ComponentTable lifted;
  DiagnosticBag diags;
  size_t queries = 0;
  const bool lifted_ok = lift_to_model(program, lifted, &diags);
  const size_t failed = lifted_ok ? check_lifted(lifted, &diags, &queries) : 0;
  log(
    "[verify] " + std::to_string(lifted.size()) + " specialization(s) re-checked, " +
    std::to_string(queries) + " solver queries");

  if (lifted_ok && failed == 0 && queries == 0) {
    return true;
  }

  auto builder = result_.diagnostics.report_error(
    SourceRange{}, "internal error: the specialized program does not re-check");
  for (const auto & d : diags) {
    builder.with_note(d.message);
  }
  if (queries != 0) {
    builder.with_note(std::to_string(queries) + " solver queries were needed");
  }
  return false;
}

// ============================================================================
// Pipeline
// ============================================================================

CompileResult run_pipeline(
  CompileResult result, const CompileOptions & options, const std::string & top,
  const fs::path & output_path)
{
  CompilationSession session(result, options);
  if (!session.analyze() || result.diagnostics.has_errors()) {
    result.success = false;
    return result;
  }

  if (options.mode == CompileMode::Build) {
    if (!output_path.parent_path().empty()) {
      std::error_code ec;
      fs::create_directories(output_path.parent_path(), ec);
      if (ec) {
        result.diagnostics.report(
          ErrorKind::Io, SourceRange{},
          "cannot create output directory " + output_path.parent_path().string() + ": " +
            ec.message());
        return result;
      }
    }
    if (!session.build(top, output_path)) {
      result.success = false;
      return result;
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

fs::path single_output_path(const fs::path & file, const CompileOptions & options)
{
  const std::string name = file.stem().string() + ".json";
  return options.output_dir ? *options.output_dir / name : file.parent_path() / name;
}

}  // namespace

CompileResult Compiler::compile_single_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  CompileResult result;
  result.module_graph = std::make_unique<ModuleGraph>();

  // Ensure file exists
  if (!fs::exists(file)) {
    result.diagnostics.report(ErrorKind::Io, SourceRange{}, "file not found: " + file.string());
    return result;
  }

  // Resolve modules (parse entry point and imports)
  ModuleResolver resolver(*result.module_graph, &result.diagnostics);
  if (!resolver.resolve(file) || resolver.has_errors()) {
    return result;
  }

  return run_pipeline(
    std::move(result), options, options.top.value_or("main"), single_output_path(file, options));
}

CompileResult Compiler::compile_source(
  const std::filesystem::path & virtual_path, std::string source, const CompileOptions & options)
{
  CompileResult result;
  result.module_graph = std::make_unique<ModuleGraph>();

  ModuleResolver resolver(*result.module_graph, &result.diagnostics);
  if (!resolver.resolve_source(virtual_path, std::move(source)) || resolver.has_errors()) {
    return result;
  }

  return run_pipeline(
    std::move(result), options, options.top.value_or("main"),
    single_output_path(virtual_path, options));
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;
  result.module_graph = std::make_unique<ModuleGraph>();

  // Handle empty entry points
  if (config.compiler.entry_points.empty()) {
    result.diagnostics.report(
      ErrorKind::Config, SourceRange{}, "no entry points defined in project configuration");
    return result;
  }

  // Command line settings win over fil.yaml.
  CompileOptions merged = options;
  merged.top = options.top.value_or(config.compiler.top);
  merged.params = config.compiler.params;
  for (const auto & [name, value] : options.params) {
    merged.params[name] = value;
  }
  merged.jobs = options.jobs > 1 ? options.jobs : config.compiler.jobs;
  merged.fail_fast = options.fail_fast || config.compiler.fail_fast;
  merged.show_models = options.show_models || config.solver.show_models;
  merged.timeout_ms = options.timeout_ms != 0 ? options.timeout_ms : config.solver.timeout_ms;
  if (!merged.dump_queries) {
    merged.dump_queries = config.solver.dump_queries;
  }

  const fs::path output_dir =
    options.output_dir.value_or(config.project_root / config.compiler.output_dir);

  bool loaded = true;
  for (const auto & entry_rel : config.compiler.entry_points) {
    const fs::path entry_path = config.project_root / entry_rel;

    if (!fs::exists(entry_path)) {
      result.diagnostics.report(
        ErrorKind::Io, SourceRange{}, "entry point not found: " + entry_path.string());
      loaded = false;
      continue;
    }

    // Every entry point is loaded into the same module graph.
    ModuleResolver resolver(*result.module_graph, &result.diagnostics);
    if (!resolver.resolve(entry_path) || resolver.has_errors()) {
      loaded = false;
    }
  }
  if (!loaded) {
    return result;
  }

  if (merged.verbose) {
    std::cerr << "[project] " << config.package.name << ": "
              << config.compiler.entry_points.size() << " entry point(s), top "
              << *merged.top << "\n";
  }

  return run_pipeline(
    std::move(result), merged, *merged.top, output_dir / (*merged.top + ".json"));
}

}  // namespace filament
