// filament/sema/model/component.cpp - Component definitions and table
#include "filament/sema/model/component.hpp"

#include <algorithm>

namespace filament
{

namespace
{

template <typename T>
const T * find_named(const std::vector<T> & items, std::string_view name)
{
  auto it = std::find_if(items.begin(), items.end(), [&](const T & t) { return t.name == name; });
  return it != items.end() ? &*it : nullptr;
}

}  // namespace

const PortDef * ComponentDef::find_input(std::string_view n) const
{
  return find_named(inputs, n);
}

const PortDef * ComponentDef::find_output(std::string_view n) const
{
  return find_named(outputs, n);
}

const ExistentialDef * ComponentDef::find_existential(std::string_view n) const
{
  return find_named(existentials, n);
}

const InstanceDef * ComponentDef::find_instance(std::string_view n) const
{
  return find_named(instances, n);
}

const InvocationDef * ComponentDef::find_invocation(std::string_view n) const
{
  return find_named(invocations, n);
}

std::vector<const PortDef *> ComponentDef::data_inputs() const
{
  std::vector<const PortDef *> out;
  for (const auto & p : inputs) {
    if (!p.is_interface) {
      out.push_back(&p);
    }
  }
  return out;
}

// ============================================================================
// ComponentTable
// ============================================================================

ComponentDef * ComponentTable::create(std::string_view name)
{
  const std::string_view key = pool_->intern(name);
  if (by_name_.count(key) != 0) {
    return nullptr;
  }
  auto def = std::make_unique<ComponentDef>();
  def->name = key;
  ComponentDef * raw = def.get();
  defs_.push_back(std::move(def));
  by_name_.emplace(key, raw);
  return raw;
}

const ComponentDef * ComponentTable::find(std::string_view name) const
{
  auto it = by_name_.find(name);
  return it != by_name_.end() ? it->second : nullptr;
}

ComponentDef * ComponentTable::find(std::string_view name)
{
  auto it = by_name_.find(name);
  return it != by_name_.end() ? it->second : nullptr;
}

}  // namespace filament
