// filament/mono/mono_component.hpp - Fully concrete components
//
// Output of the monomorphizer: every parameter, existential, interval,
// width, delay and start time is a literal, and time is relative to the
// component's own event (cycle 0).
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "filament/sema/model/component.hpp"

namespace filament
{

/// Specialization identity: a definition and its concrete arguments.
struct SpecKey
{
  const ComponentDef * def = nullptr;
  std::vector<int64_t> args;

  [[nodiscard]] bool operator==(const SpecKey & other) const noexcept
  {
    return def == other.def && args == other.args;
  }
  [[nodiscard]] bool operator!=(const SpecKey & other) const noexcept { return !(*this == other); }

  /// `Mul[32, 3]`
  [[nodiscard]] std::string render() const;

  /// `Mul_32_3`; unique per key within a program.
  [[nodiscard]] std::string mangle() const;
};

struct SpecKeyHash
{
  size_t operator()(const SpecKey & key) const noexcept;
};

struct MonoComponent;

struct MonoPort
{
  std::string name;
  PortDirection direction = PortDirection::In;
  bool is_interface = false;
  int64_t start = 0;
  int64_t end = 0;
  int64_t width = 0;  ///< 0 for interface ports
};

struct MonoInstance
{
  std::string name;
  const MonoComponent * component = nullptr;
};

struct MonoSource
{
  PortSource::Kind kind = PortSource::Kind::Own;
  std::string invocation;
  std::string port;
  int64_t constant = 0;

  /// `a`, `m0.out` or `1`
  [[nodiscard]] std::string render() const;
};

struct MonoInvocation
{
  std::string name;
  std::string instance;
  int64_t start = 0;
  std::vector<MonoSource> args;
};

struct MonoBinding
{
  std::string output;
  MonoSource src;
};

struct MonoComponent
{
  SpecKey key;
  std::string name;        ///< mangled
  std::string definition;  ///< name of the generic definition
  std::string event;
  bool is_extern = false;
  int64_t delay = 1;

  std::vector<std::pair<std::string, int64_t>> params;
  std::vector<std::pair<std::string, int64_t>> existentials;

  std::vector<MonoPort> inputs;
  std::vector<MonoPort> outputs;
  std::vector<MonoInstance> instances;
  std::vector<MonoInvocation> invocations;
  std::vector<MonoBinding> bindings;

  [[nodiscard]] const int64_t * existential(std::string_view n) const;
};

/**
 * Result of monomorphization: every specialization reachable from the
 * entry, callees before callers, each exactly once.
 */
struct MonoProgram
{
  std::vector<std::shared_ptr<const MonoComponent>> components;
  const MonoComponent * entry = nullptr;

  [[nodiscard]] const MonoComponent * find(std::string_view mangled) const;

  /// All specializations of one generic definition.
  [[nodiscard]] std::vector<const MonoComponent *> of_definition(std::string_view name) const;
};

}  // namespace filament
