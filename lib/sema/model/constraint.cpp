// filament/sema/model/constraint.cpp - Comparison helpers
#include "filament/sema/model/constraint.hpp"

namespace filament
{

std::optional<bool> decide(const Comparison & cmp)
{
  if (cmp.lhs == cmp.rhs) {
    switch (cmp.op) {
      case CmpOp::Eq:
      case CmpOp::Le:
      case CmpOp::Ge:
        return true;
      case CmpOp::Ne:
      case CmpOp::Lt:
      case CmpOp::Gt:
        return false;
    }
  }

  const auto l = evaluate(cmp.lhs);
  const auto r = evaluate(cmp.rhs);
  if (!l || !r) {
    return std::nullopt;
  }
  return holds(cmp.op, *l, *r);
}

std::optional<bool> decide(ExprPool & pool, const Comparison & cmp)
{
  if (auto r = decide(cmp)) {
    return r;
  }
  const ValueExpr * diff = pool.binary(BinaryOp::Sub, cmp.lhs, cmp.rhs);
  if (!diff->is_const()) {
    return std::nullopt;
  }
  return decide(Comparison{cmp.op, diff, pool.constant(0)});
}

Comparison substitute(ExprPool & pool, const Comparison & cmp, const Substitution & s)
{
  return Comparison{cmp.op, pool.substitute(cmp.lhs, s), pool.substitute(cmp.rhs, s)};
}

std::string render(const Comparison & cmp)
{
  return render(cmp.lhs) + " " + std::string(to_string(cmp.op)) + " " + render(cmp.rhs);
}

std::string_view to_string(ConstraintOrigin origin) noexcept
{
  switch (origin) {
    case ConstraintOrigin::CalleeGuard:
      return "guard of an instantiated component";
    case ConstraintOrigin::ExistentialGuard:
      return "existential guard";
    case ConstraintOrigin::PortInterval:
      return "port interval";
    case ConstraintOrigin::PortWidth:
      return "port width";
    case ConstraintOrigin::WellFormed:
      return "well-formedness";
    case ConstraintOrigin::Reuse:
      return "instance reuse";
  }
  return "constraint";
}

std::string Constraint::render() const
{
  std::string out;
  for (size_t i = 0; i < terms.size(); ++i) {
    if (i != 0) out += disjunctive ? " || " : " && ";
    out += filament::render(terms[i]);
  }
  return out;
}

std::string Assumption::render() const
{
  std::string out;
  for (size_t i = 0; i < premises.size(); ++i) {
    if (i != 0) out += " && ";
    out += filament::render(premises[i]);
  }
  if (!out.empty()) out += " -> ";
  return out + filament::render(cmp);
}

}  // namespace filament
