// filament/sema/check/type_checker.hpp - Temporal type checker
//
// Checks one component against the signatures of the components it
// instantiates and produces its constraint set. Everything that can be
// decided without a solver (ground or syntactically equal sides) is decided
// here and reported immediately; the rest becomes proof obligations for the
// Discharger.
//
#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "filament/basic/diagnostic.hpp"
#include "filament/sema/model/component.hpp"
#include "filament/sema/model/constraint.hpp"

namespace filament
{

struct CheckedPort
{
  std::string_view name;
  Interval interval;
  const ValueExpr * width = nullptr;
};

/// An invocation with its ports placed in the caller's time frame.
struct CheckedInvocation
{
  std::string_view name;
  std::string_view instance;
  const ComponentDef * callee = nullptr;
  TimeExpr time;
  Interval window;                   ///< `[t, t+D]`, end exclusive
  std::vector<CheckedPort> inputs;   ///< required intervals of the data inputs
  std::vector<CheckedPort> outputs;  ///< guaranteed intervals of the outputs
};

/**
 * Result of checking one component.
 *
 * All expressions are flattened: explicit existential definitions (own and
 * visible callee ones) are substituted away. What remains are value
 * parameters, opaque callee existentials and the component's free
 * existentials.
 */
struct CheckedComponent
{
  const ComponentDef * def = nullptr;

  /// Own existential or instance existential -> defining expression.
  Substitution flattening;

  /// Own existentials without a definition.
  std::vector<const ValueExpr *> free_existentials;

  /// Per own existential (declaration order): its value as an expression over
  /// the value parameters, or nullptr if it is not determined by them.
  std::vector<const ValueExpr *> exported;

  std::vector<Assumption> assumptions;
  std::vector<Constraint> obligations;
  std::vector<CheckedInvocation> invocations;

  /// Flattened port intervals of the component itself.
  std::vector<CheckedPort> inputs;
  std::vector<CheckedPort> outputs;
  const ValueExpr * delay = nullptr;

  bool has_errors = false;

  [[nodiscard]] const CheckedInvocation * find_invocation(std::string_view name) const;

  /// True if the constraint mentions a free existential of this component.
  [[nodiscard]] bool mentions_free_existential(const Constraint & c) const;
};

/// Returns the checked result of an already checked component, or nullptr.
using CheckedLookup = std::function<const CheckedComponent *(const ComponentDef *)>;

/**
 * Temporal type checker for one component.
 *
 * @code
 *   TypeChecker checker(table.pool(), lookup, &diags);
 *   CheckedComponent checked = checker.check(*def);
 * @endcode
 */
class TypeChecker
{
public:
  TypeChecker(ExprPool & pool, CheckedLookup lookup, DiagnosticBag * diags = nullptr)
  : pool_(pool), lookup_(std::move(lookup)), diags_(diags)
  {
  }

  /// Check `def`. The result is always returned; `has_errors` tells whether
  /// something was reported.
  CheckedComponent check(const ComponentDef & def);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  /**
   * Existential values of `def` expressed over its value parameters,
   * using only its signature (the `with` block definitions).
   */
  static std::vector<const ValueExpr *> signature_exports(const ComponentDef & def, ExprPool & pool);

private:
  struct InstanceInfo
  {
    const InstanceDef * inst = nullptr;
    const ComponentDef * callee = nullptr;
    Substitution subst;  ///< callee params and existentials -> caller terms
    bool arity_ok = false;
  };

  // Phases
  void bind_instances(const ComponentDef & def);
  void flatten_existentials(const ComponentDef & def);
  void check_signature(const ComponentDef & def);
  void check_instance_guards();
  /// Facts the callee of `info` guarantees, conditional on its guards.
  void assume_callee_facts(const InstanceInfo & info);
  void place_invocations(const ComponentDef & def);
  void check_invocation_args(const ComponentDef & def);
  void check_bindings(const ComponentDef & def);
  void check_reuse(const ComponentDef & def);
  void collect_existential_guards(const ComponentDef & def);
  void compute_exports(const ComponentDef & def);

  // Helpers
  const ValueExpr * flat(const ValueExpr * e);
  TimeExpr flat(const TimeExpr & t);
  Interval flat(const Interval & i);

  /// Supplied interval and width of a port source; false for constants or
  /// unresolvable sources.
  bool source_port(const PortSource & src, CheckedPort & out) const;

  /// Require `supplied` to be exactly `required` (intervals and widths).
  void require_match(
    const CheckedPort & required, const CheckedPort & supplied, SourceRange range,
    const std::string & what);

  /// Decide `c` eagerly; report it if false, keep it as an obligation if
  /// undecided.
  void obligate(Constraint c);

  void report_error(
    ErrorKind kind, SourceRange range, std::string message, std::string label = "",
    std::vector<std::string> notes = {});

  ExprPool & pool_;
  CheckedLookup lookup_;
  DiagnosticBag * diags_;

  CheckedComponent result_;
  std::vector<InstanceInfo> instances_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace filament
