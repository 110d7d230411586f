// filament/sema/check/component_order.hpp - Definition graph ordering
//
// Components depend on the components they instantiate. Checking follows
// the dependency order so that every callee is checked before its callers;
// components of the same level are independent of each other.
//
#pragma once

#include <unordered_set>
#include <vector>

#include "filament/sema/model/component.hpp"

namespace filament
{

struct ComponentOrder
{
  /// `levels[0]` instantiates nothing checked later; level `k` only
  /// instantiates components of levels `< k` (or recursively itself).
  std::vector<std::vector<const ComponentDef *>> levels;

  /// Components on a cycle of the definition graph. Their callers are
  /// checked against signatures only; the monomorphizer decides whether the
  /// instantiation terminates.
  std::unordered_set<const ComponentDef *> recursive;

  /// Flattened levels.
  [[nodiscard]] std::vector<const ComponentDef *> flatten() const;
};

[[nodiscard]] ComponentOrder compute_component_order(const ComponentTable & table);

}  // namespace filament
