// filament/sema/check/component_order.cpp - Definition graph ordering
#include "filament/sema/check/component_order.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>

namespace filament
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

}  // namespace

std::vector<const ComponentDef *> ComponentOrder::flatten() const
{
  std::vector<const ComponentDef *> out;
  for (const auto & level : levels) {
    out.insert(out.end(), level.begin(), level.end());
  }
  return out;
}

ComponentOrder compute_component_order(const ComponentTable & table)
{
  ComponentOrder order;

  std::unordered_map<const ComponentDef *, Color> color;
  std::unordered_map<const ComponentDef *, size_t> level;
  color.reserve(table.size());
  for (const auto & def : table.components()) {
    color.emplace(def.get(), Color::White);
  }

  std::vector<const ComponentDef *> stack;
  stack.reserve(64);

  std::function<void(const ComponentDef *)> dfs;
  dfs = [&](const ComponentDef * u) {
    color[u] = Color::Gray;
    stack.push_back(u);

    size_t my_level = 0;
    for (const auto & inst : u->instances) {
      const ComponentDef * callee = inst.component;
      if (callee == nullptr) continue;

      const Color c = color[callee];
      if (c == Color::Gray) {
        // Back edge: everything from the callee to the top of the stack is
        // on the cycle.
        auto it = std::find(stack.begin(), stack.end(), callee);
        for (; it != stack.end(); ++it) {
          order.recursive.insert(*it);
        }
        continue;
      }
      if (c == Color::White) {
        dfs(callee);
      }
      my_level = std::max(my_level, level[callee] + 1);
    }

    level[u] = my_level;
    stack.pop_back();
    color[u] = Color::Black;
  };

  for (const auto & def : table.components()) {
    if (color[def.get()] == Color::White) {
      dfs(def.get());
    }
  }

  // Bucket by level, keeping table order inside a level for stable output.
  for (const auto & def : table.components()) {
    const size_t l = level[def.get()];
    if (order.levels.size() <= l) {
      order.levels.resize(l + 1);
    }
    order.levels[l].push_back(def.get());
  }
  return order;
}

}  // namespace filament
