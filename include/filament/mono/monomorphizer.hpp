// filament/mono/monomorphizer.hpp - Specialization of checked components
//
// Turns a checked entry component and concrete arguments into a MonoProgram.
// Runs only on programs that checked without errors; every error reported
// here is fatal.
//
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include "filament/basic/diagnostic.hpp"
#include "filament/mono/instantiation_graph.hpp"
#include "filament/mono/mono_component.hpp"
#include "filament/mono/specialization_cache.hpp"
#include "filament/sema/check/type_checker.hpp"
#include "filament/solver/solver_session.hpp"

namespace filament
{

struct MonoOptions
{
  /// Sibling instances are specialized concurrently when > 1.
  size_t jobs = 1;
  size_t max_depth = InstantiationGraph::kDefaultMaxDepth;
  SolverOptions solver;
};

/**
 * Monomorphizer.
 *
 * @code
 *   SpecializationCache cache;
 *   Monomorphizer mono(table.pool(), lookup, cache, &diags);
 *   std::optional<MonoProgram> program = mono.run(*main, {});
 * @endcode
 *
 * Per specialization key, children are specialized first. Existentials with
 * a definition are evaluated; free ones are solved with the parameters and
 * the children's existentials fixed, and must have exactly one value.
 */
class Monomorphizer
{
public:
  Monomorphizer(
    ExprPool & pool, CheckedLookup lookup, SpecializationCache & cache,
    DiagnosticBag * diags = nullptr, MonoOptions options = {}, std::ostream * log = nullptr)
  : pool_(pool),
    lookup_(std::move(lookup)),
    cache_(cache),
    diags_(diags),
    options_(std::move(options)),
    log_(log)
  {
  }

  std::optional<MonoProgram> run(const ComponentDef & entry, const std::vector<int64_t> & args);

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ != 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  /// Solver checks issued while resolving free existentials.
  [[nodiscard]] size_t solver_queries() const noexcept { return solver_queries_; }

private:
  using Result = std::shared_ptr<const MonoComponent>;

  bool check_entry(const ComponentDef & entry, const std::vector<int64_t> & args);

  Result produce(size_t node);
  Result specialize(const InstantiationGraph::Node & node, const std::vector<Result> & children);

  /// Solve the free existentials of `checked`; values are added to `env`.
  bool solve_free(
    const SpecKey & key, const CheckedComponent & checked, Environment & env,
    Substitution & ground);

  void report_error(
    ErrorKind kind, SourceRange range, std::string message, std::string label = "",
    std::vector<std::string> notes = {});

  void trace(const std::string & line);

  ExprPool & pool_;
  CheckedLookup lookup_;
  SpecializationCache & cache_;
  DiagnosticBag * diags_;
  MonoOptions options_;
  std::ostream * log_;

  std::unique_ptr<InstantiationGraph> graph_;

  std::mutex report_mutex_;
  std::atomic<size_t> error_count_{0};
  std::atomic<size_t> solver_queries_{0};
};

}  // namespace filament
