// filament/solver/discharge.hpp - Proof obligation discharge
//
// Decides the constraint set a TypeChecker produced for one component and
// maps every failure back to the clause that produced it.
//
#pragma once

#include <ostream>

#include "filament/basic/diagnostic.hpp"
#include "filament/sema/check/type_checker.hpp"
#include "filament/solver/solver_session.hpp"

namespace filament
{

/**
 * Discharges a CheckedComponent.
 *
 * - Obligations without free existentials must follow from the
 *   assumptions. They are tried jointly, and one by one on failure so that
 *   each failing clause is reported with its own kind.
 * - Obligations over free existentials must be solvable for every
 *   parameter assignment (UnsatisfiableConstraints) and determine each free
 *   existential uniquely (UnderconstrainedExistential). Extern components
 *   have no body that could fix them, so only solvability is required.
 * - A solver `unknown` is reported as SolverUnknown.
 */
class Discharger
{
public:
  Discharger(SolverSession & session, DiagnosticBag * diags = nullptr, std::ostream * log = nullptr)
  : session_(session), diags_(diags), log_(log)
  {
  }

  bool discharge(const CheckedComponent & checked);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void discharge_fixed(const CheckedComponent & checked, const std::vector<Constraint> & fixed);
  void discharge_free(const CheckedComponent & checked, const std::vector<Constraint> & open);

  [[nodiscard]] SolverQuery base_query(const CheckedComponent & checked) const;

  void report_failure(const Constraint & c, const ProofResult & proof);
  void report_unknown(SourceRange range, const std::string & what, const std::string & reason);

  void log_component(const CheckedComponent & checked) const;

  SolverSession & session_;
  DiagnosticBag * diags_;
  std::ostream * log_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace filament
