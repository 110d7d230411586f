// filament/solver/solver_session.hpp - Z3-backed decision procedure
//
// The checker's constraints are translated to integer arithmetic with every
// variable constrained to be a natural. `pow2` and `log2` are uninterpreted
// functions. Each session owns an independent Z3 context, so sessions can be
// used concurrently from different threads; a single session cannot.
//
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "filament/sema/model/constraint.hpp"

namespace filament
{

struct SolverOptions
{
  /// Add counterexamples and solver models to diagnostics.
  bool show_models = false;
  /// Per-query timeout; 0 means none.
  unsigned timeout_ms = 0;
  /// When set, every query is appended to this file in SMT-LIB form.
  std::string dump_queries;
};

/// `premises -> conclusion`; a fact that holds only under the premises.
struct Implication
{
  std::vector<Comparison> premises;
  Comparison conclusion;
};

/**
 * One solver request.
 *
 * `unknowns` are existentially quantified; every other variable occurring in
 * `assumptions` or `constraints` is universally quantified.
 */
struct SolverQuery
{
  std::vector<const ValueExpr *> unknowns;
  std::vector<Comparison> assumptions;
  std::vector<Implication> implications;
  std::vector<Constraint> constraints;
  std::string description;  ///< shown in the query dump
};

enum class SolverStatus : uint8_t {
  Sat,        ///< solved; assignment holds the values of the unknowns
  Unsat,      ///< no assignment; unsat_core lists offending constraints
  Ambiguous,  ///< more than one assignment; `ambiguous` differs between two
  Unknown,    ///< solver gave up (timeout, nonlinear, ...)
};

[[nodiscard]] std::string_view to_string(SolverStatus status) noexcept;

using Assignment = std::vector<std::pair<const ValueExpr *, int64_t>>;

/// "W = 0, L = 3"
[[nodiscard]] std::string render(const Assignment & assignment);

struct SolverResponse
{
  SolverStatus status = SolverStatus::Unknown;
  Assignment assignment;
  std::vector<size_t> unsat_core;  ///< indices into SolverQuery::constraints
  const ValueExpr * ambiguous = nullptr;
  int64_t first = 0;
  int64_t second = 0;
  std::string reason;

  [[nodiscard]] bool is_sat() const noexcept { return status == SolverStatus::Sat; }
};

enum class ProofStatus : uint8_t {
  Proved,
  Refuted,
  Unknown,
};

struct ProofResult
{
  ProofStatus status = ProofStatus::Unknown;
  /// Values of the universally quantified variables that falsify the claim.
  Assignment counterexample;
  /// prove_unique: two distinct values of the variable.
  int64_t first = 0;
  int64_t second = 0;
  std::string reason;

  [[nodiscard]] bool proved() const noexcept { return status == ProofStatus::Proved; }
};

class SolverSession
{
public:
  explicit SolverSession(SolverOptions options = {});
  ~SolverSession();

  SolverSession(const SolverSession &) = delete;
  SolverSession & operator=(const SolverSession &) = delete;

  /**
   * Solve for `unknowns` concretely, requiring the assignment to be unique.
   *
   * All other variables must not occur; the monomorphizer only calls this
   * once every parameter is a literal.
   */
  SolverResponse solve(const SolverQuery & query);

  /**
   * Prove `forall U. assumptions -> exists unknowns. constraints`
   * (implications count as assumptions)
   * where U are all other variables. Without unknowns this is plain
   * validity of the constraints under the assumptions.
   */
  ProofResult prove(const SolverQuery & query);

  /**
   * Prove that `var` (one of the unknowns) has at most one value:
   * `assumptions /\ C(E) /\ C(E') /\ var != var'` is unsatisfiable.
   */
  ProofResult prove_unique(const SolverQuery & query, const ValueExpr * var);

  [[nodiscard]] const SolverOptions & options() const noexcept { return options_; }

  /// Number of solver checks issued by this session.
  [[nodiscard]] size_t query_count() const noexcept { return query_count_; }

  /// Number of solver checks issued by all sessions of the process.
  [[nodiscard]] static size_t total_queries() noexcept;

private:
  struct Impl;

  SolverOptions options_;
  std::unique_ptr<Impl> impl_;
  size_t query_count_ = 0;

  static std::atomic<size_t> total_queries_;
};

}  // namespace filament
