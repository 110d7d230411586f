// filament/mono/mono_component.cpp - Concrete component helpers
#include "filament/mono/mono_component.hpp"

#include <algorithm>
#include <functional>

namespace filament
{

std::string SpecKey::render() const
{
  std::string out = def != nullptr ? std::string(def->name) : std::string("?");
  if (args.empty()) {
    return out;
  }
  out += "[";
  for (size_t i = 0; i < args.size(); ++i) {
    if (i != 0) out += ", ";
    out += std::to_string(args[i]);
  }
  return out + "]";
}

std::string SpecKey::mangle() const
{
  std::string out = def != nullptr ? std::string(def->name) : std::string("anon");
  for (const int64_t a : args) {
    out += "_" + std::to_string(a);
  }
  return out;
}

size_t SpecKeyHash::operator()(const SpecKey & key) const noexcept
{
  size_t h = std::hash<const void *>{}(key.def);
  for (const int64_t a : key.args) {
    h ^= std::hash<int64_t>{}(a) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
  }
  return h;
}

std::string MonoSource::render() const
{
  switch (kind) {
    case PortSource::Kind::Constant:
      return std::to_string(constant);
    case PortSource::Kind::Own:
      return port;
    case PortSource::Kind::Invocation:
      return invocation + "." + port;
  }
  return port;
}

const int64_t * MonoComponent::existential(std::string_view n) const
{
  auto it = std::find_if(
    existentials.begin(), existentials.end(), [&](const auto & e) { return e.first == n; });
  return it != existentials.end() ? &it->second : nullptr;
}

const MonoComponent * MonoProgram::find(std::string_view mangled) const
{
  auto it = std::find_if(components.begin(), components.end(), [&](const auto & c) {
    return c->name == mangled;
  });
  return it != components.end() ? it->get() : nullptr;
}

std::vector<const MonoComponent *> MonoProgram::of_definition(std::string_view name) const
{
  std::vector<const MonoComponent *> out;
  for (const auto & c : components) {
    if (c->definition == name) out.push_back(c.get());
  }
  return out;
}

}  // namespace filament
