// filament/sema/model/interval.hpp - Time expressions and intervals
#pragma once

#include <string>
#include <string_view>

#include "filament/sema/model/expr.hpp"

namespace filament
{

/**
 * A point in time relative to a component's event: `G`, `G+4`, `G+L`.
 *
 * Every component has exactly one event, so the offset alone identifies the
 * point; the event name is kept for rendering.
 */
struct TimeExpr
{
  std::string_view event;
  const ValueExpr * offset = nullptr;

  [[nodiscard]] bool operator==(const TimeExpr & other) const noexcept
  {
    return offset == other.offset;
  }
  [[nodiscard]] bool operator!=(const TimeExpr & other) const noexcept
  {
    return !(*this == other);
  }
};

/// `[start, end]` of a signal's validity, end exclusive.
struct Interval
{
  TimeExpr start;
  TimeExpr end;

  [[nodiscard]] bool operator==(const Interval & other) const noexcept
  {
    return start == other.start && end == other.end;
  }
  [[nodiscard]] bool operator!=(const Interval & other) const noexcept
  {
    return !(*this == other);
  }
};

[[nodiscard]] inline std::string render(const TimeExpr & t)
{
  if (t.offset == nullptr || t.offset->is_const(0)) {
    return std::string(t.event);
  }
  return std::string(t.event) + "+" + render(t.offset);
}

[[nodiscard]] inline std::string render(const Interval & i)
{
  return "[" + render(i.start) + ", " + render(i.end) + "]";
}

/// Shift a time point by `delta` cycles.
[[nodiscard]] inline TimeExpr shift(ExprPool & pool, const TimeExpr & t, const ValueExpr * delta)
{
  return TimeExpr{t.event, pool.add(delta, t.offset)};
}

/// Rebase a time point onto another event (e.g. callee time onto the invocation time).
[[nodiscard]] inline TimeExpr rebase(
  ExprPool & pool, const TimeExpr & t, const TimeExpr & origin, const Substitution & subst)
{
  return TimeExpr{origin.event, pool.add(origin.offset, pool.substitute(t.offset, subst))};
}

}  // namespace filament
