// filament/sema/model/constraint.hpp - Comparisons and proof obligations
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "filament/basic/diagnostic.hpp"
#include "filament/sema/model/expr.hpp"

namespace filament
{

enum class CmpOp : uint8_t {
  Eq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

[[nodiscard]] constexpr std::string_view to_string(CmpOp op) noexcept
{
  switch (op) {
    case CmpOp::Eq:
      return "==";
    case CmpOp::Ne:
      return "!=";
    case CmpOp::Lt:
      return "<";
    case CmpOp::Le:
      return "<=";
    case CmpOp::Gt:
      return ">";
    case CmpOp::Ge:
      return ">=";
  }
  return "?";
}

/// Map a comparison BinaryOp of the AST to CmpOp; nullopt for arithmetic.
[[nodiscard]] constexpr std::optional<CmpOp> to_cmp_op(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Eq:
      return CmpOp::Eq;
    case BinaryOp::Ne:
      return CmpOp::Ne;
    case BinaryOp::Lt:
      return CmpOp::Lt;
    case BinaryOp::Le:
      return CmpOp::Le;
    case BinaryOp::Gt:
      return CmpOp::Gt;
    case BinaryOp::Ge:
      return CmpOp::Ge;
    default:
      return std::nullopt;
  }
}

/// `l op r` on concrete values.
[[nodiscard]] constexpr bool holds(CmpOp op, int64_t l, int64_t r) noexcept
{
  switch (op) {
    case CmpOp::Eq:
      return l == r;
    case CmpOp::Ne:
      return l != r;
    case CmpOp::Lt:
      return l < r;
    case CmpOp::Le:
      return l <= r;
    case CmpOp::Gt:
      return l > r;
    case CmpOp::Ge:
      return l >= r;
  }
  return false;
}

struct Comparison
{
  CmpOp op = CmpOp::Eq;
  const ValueExpr * lhs = nullptr;
  const ValueExpr * rhs = nullptr;
};

/**
 * Decide a comparison without a solver.
 *
 * Ground comparisons are evaluated; pointer-equal sides (interning makes
 * this syntactic equality) decide reflexive operators.
 */
[[nodiscard]] std::optional<bool> decide(const Comparison & cmp);

/// As above, and additionally folds `lhs - rhs` (so `L+1 > L` is decided).
[[nodiscard]] std::optional<bool> decide(ExprPool & pool, const Comparison & cmp);

[[nodiscard]] Comparison substitute(ExprPool & pool, const Comparison & cmp, const Substitution & s);

[[nodiscard]] std::string render(const Comparison & cmp);

/// Where a constraint came from.
enum class ConstraintOrigin : uint8_t {
  CalleeGuard,       ///< `where` clause of an instantiated component
  ExistentialGuard,  ///< `where` clause of one of the component's own existentials
  PortInterval,      ///< exact interval match of an argument or output binding
  PortWidth,         ///< width match
  WellFormed,        ///< non-empty interval, positive delay
  Reuse,             ///< disjoint invocation windows
};

[[nodiscard]] std::string_view to_string(ConstraintOrigin origin) noexcept;

/**
 * A proof obligation: the conjunction (or, when `disjunctive`, the
 * disjunction) of `terms` must hold for every assignment of the component's
 * parameters that satisfies its assumptions.
 */
struct Constraint
{
  std::vector<Comparison> terms;
  bool disjunctive = false;
  ConstraintOrigin origin = ConstraintOrigin::PortInterval;
  ErrorKind kind = ErrorKind::IntervalMismatch;
  SourceRange range;
  std::string message;           ///< diagnostic headline if the obligation fails
  std::string label;             ///< primary label text
  std::vector<std::string> notes;
  SourceRange related_range;  ///< e.g. the guard's declaration
  std::string related_label;

  /// Rendered terms, `a == b && c == d` or `a <= b || c <= d`.
  [[nodiscard]] std::string render() const;
};

/**
 * A fact the component may rely on.
 *
 * Facts learned from an instantiated component hold only under that
 * component's own guards; those are kept as `premises` so the fact cannot
 * be used to prove the guards themselves.
 */
struct Assumption
{
  Comparison cmp;
  std::string source;  ///< e.g. "where W > 0" or "M2.L = 4"
  std::vector<Comparison> premises;

  /// "W > 3 -> L > 3", or just the comparison when unconditional.
  [[nodiscard]] std::string render() const;
};

}  // namespace filament
