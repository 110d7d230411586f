// filament/solver/discharge.cpp - Proof obligation discharge
#include "filament/solver/discharge.hpp"

#include <algorithm>
#include <cstddef>

namespace filament
{

namespace
{

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

const ExistentialDef * find_existential(const ComponentDef & def, const ValueExpr * var)
{
  auto it = std::find_if(def.existentials.begin(), def.existentials.end(), [&](const auto & e) {
    return e.var == var;
  });
  return it != def.existentials.end() ? &*it : nullptr;
}

}  // namespace

bool Discharger::discharge(const CheckedComponent & checked)
{
  has_errors_ = false;
  error_count_ = 0;

  log_component(checked);

  std::vector<Constraint> fixed;
  std::vector<Constraint> open;
  for (const auto & c : checked.obligations) {
    (checked.mentions_free_existential(c) ? open : fixed).push_back(c);
  }

  if (!fixed.empty()) {
    discharge_fixed(checked, fixed);
  }
  if (!checked.free_existentials.empty()) {
    discharge_free(checked, open);
  }

  if (log_ != nullptr) {
    *log_ << "  solver queries so far: " << session_.query_count() << "\n";
  }
  return !has_errors_;
}

SolverQuery Discharger::base_query(const CheckedComponent & checked) const
{
  SolverQuery q;
  q.assumptions.reserve(checked.assumptions.size());
  for (const auto & a : checked.assumptions) {
    if (a.premises.empty()) {
      q.assumptions.push_back(a.cmp);
    } else {
      q.implications.push_back(Implication{a.premises, a.cmp});
    }
  }
  return q;
}

// ============================================================================
// Obligations over parameters
// ============================================================================

void Discharger::discharge_fixed(
  const CheckedComponent & checked, const std::vector<Constraint> & fixed)
{
  SolverQuery q = base_query(checked);
  q.constraints = fixed;
  q.description = std::string(checked.def->name) + ": all obligations";
  if (session_.prove(q).proved()) {
    return;
  }

  for (const auto & c : fixed) {
    q.constraints = {c};
    q.description = std::string(checked.def->name) + ": " + c.render();
    const ProofResult r = session_.prove(q);
    if (r.status == ProofStatus::Refuted) {
      report_failure(c, r);
    } else if (r.status == ProofStatus::Unknown) {
      report_unknown(c.range, c.message, r.reason);
    }
  }
}

// ============================================================================
// Free existentials
// ============================================================================

void Discharger::discharge_free(
  const CheckedComponent & checked, const std::vector<Constraint> & open)
{
  const ComponentDef & def = *checked.def;

  SolverQuery q = base_query(checked);
  q.unknowns = checked.free_existentials;
  q.constraints = open;
  q.description = std::string(def.name) + ": existentials solvable";

  const ProofResult solvable = session_.prove(q);
  if (solvable.status == ProofStatus::Unknown) {
    report_unknown(def.range, "existentials of " + quote_name(def.name), solvable.reason);
    return;
  }
  if (solvable.status == ProofStatus::Refuted) {
    // The earliest clause whose addition makes the block unsolvable is the
    // one reported.
    const Constraint * culprit = open.empty() ? nullptr : &open.back();
    ProofResult culprit_proof = solvable;
    for (size_t k = 1; k < open.size(); ++k) {
      SolverQuery prefix = q;
      prefix.constraints.assign(open.begin(), open.begin() + static_cast<std::ptrdiff_t>(k));
      const ProofResult r = session_.prove(prefix);
      if (r.status == ProofStatus::Refuted) {
        culprit = &open[k - 1];
        culprit_proof = r;
        break;
      }
    }

    has_errors_ = true;
    error_count_++;
    if (diags_ == nullptr) return;

    std::string names;
    for (const ValueExpr * e : checked.free_existentials) {
      if (!names.empty()) names += ", ";
      names += render(e);
    }
    const SourceRange range = culprit != nullptr ? culprit->range : def.range;
    auto builder = diags_->report(
      ErrorKind::UnsatisfiableConstraints, range,
      "no value of " + names + " satisfies the constraints of " + quote_name(def.name),
      culprit != nullptr ? culprit->label : "");
    if (culprit != nullptr) {
      builder.with_note(
        "failing clause (" + std::string(to_string(culprit->origin)) + "): " + culprit->message);
      builder.with_note("constraint: " + culprit->render());
      for (const auto & n : culprit->notes) {
        builder.with_note(n);
      }
    }
    if (session_.options().show_models && !culprit_proof.counterexample.empty()) {
      builder.with_note("counterexample: " + render(culprit_proof.counterexample));
    }
    return;
  }

  if (def.is_extern) {
    return;
  }

  for (const ValueExpr * e : checked.free_existentials) {
    SolverQuery uq = q;
    uq.description = std::string(def.name) + ": " + render(e) + " unique";
    const ProofResult r = session_.prove_unique(uq, e);
    const ExistentialDef * decl = find_existential(def, e);
    const SourceRange range = decl != nullptr ? decl->range : def.range;

    if (r.status == ProofStatus::Unknown) {
      report_unknown(range, "existential " + quote_name(render(e)), r.reason);
      continue;
    }
    if (r.status != ProofStatus::Refuted) {
      continue;
    }

    has_errors_ = true;
    error_count_++;
    if (diags_ == nullptr) continue;
    auto builder = diags_->report(
      ErrorKind::UnderconstrainedExistential, range,
      "existential " + quote_name(render(e)) + " of " + quote_name(def.name) +
        " is not uniquely determined",
      "declared here");
    builder.with_note(
      "both " + render(e) + " = " + std::to_string(r.first) + " and " + render(e) + " = " +
      std::to_string(r.second) + " satisfy every constraint");
    if (session_.options().show_models && !r.counterexample.empty()) {
      builder.with_note("with " + render(r.counterexample));
    }
    builder.with_help(
      "define it with `exists " + render(e) + " = ...;` or tie it to a port interval");
  }
}

// ============================================================================
// Reporting
// ============================================================================

void Discharger::report_failure(const Constraint & c, const ProofResult & proof)
{
  has_errors_ = true;
  error_count_++;
  if (diags_ == nullptr) return;

  auto builder = diags_->report(c.kind, c.range, c.message, c.label);
  for (const auto & n : c.notes) {
    builder.with_note(n);
  }
  builder.with_note("cannot prove: " + c.render());
  if (session_.options().show_models && !proof.counterexample.empty()) {
    builder.with_note("counterexample: " + render(proof.counterexample));
  }
  if (c.related_range.is_valid()) {
    builder.with_secondary_label(c.related_range, c.related_label);
  }
}

void Discharger::report_unknown(
  SourceRange range, const std::string & what, const std::string & reason)
{
  has_errors_ = true;
  error_count_++;
  if (diags_ != nullptr) {
    diags_->report(ErrorKind::SolverUnknown, range, "solver could not decide " + what)
      .with_note("reason: " + (reason.empty() ? std::string("unknown") : reason));
  }
}

void Discharger::log_component(const CheckedComponent & checked) const
{
  if (log_ == nullptr) return;

  *log_ << "[discharge] " << checked.def->name << "\n";
  *log_ << "  known facts:\n";
  for (const auto & a : checked.assumptions) {
    *log_ << "    " << a.render() << "    // " << a.source << "\n";
  }
  *log_ << "  proof obligations:\n";
  for (const auto & c : checked.obligations) {
    *log_ << "    " << c.render() << "    // " << to_string(c.origin) << "\n";
  }
  if (!checked.free_existentials.empty()) {
    *log_ << "  free existentials:";
    for (const ValueExpr * e : checked.free_existentials) {
      *log_ << " " << render(e);
    }
    *log_ << "\n";
  }
}

}  // namespace filament
