// filament/sema/model/component.hpp - Semantic component definitions
//
// The resolved AST lowered into expressions of the ExprPool. Definitions are
// owned by the ComponentTable; instances refer to their definition through
// non-owning pointers.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "filament/basic/source_manager.hpp"
#include "filament/sema/model/constraint.hpp"
#include "filament/sema/model/expr.hpp"
#include "filament/sema/model/interval.hpp"
#include "filament/sema/resolution/symbol_table.hpp"

namespace filament
{

struct ComponentDef;

struct PortDef
{
  std::string_view name;
  PortDirection direction = PortDirection::In;
  bool is_interface = false;
  Interval interval;
  const ValueExpr * width = nullptr;  ///< nullptr for interface ports
  SourceRange range;
};

struct Guard
{
  Comparison cmp;
  SourceRange range;
};

struct ExistentialDef
{
  std::string_view name;
  const ValueExpr * var = nullptr;
  const ValueExpr * definition = nullptr;  ///< `exists L = e`, in the signature or the body
  SourceRange definition_range;
  std::vector<Guard> guards;
  SourceRange range;
};

struct InstanceDef
{
  std::string_view name;
  const ComponentDef * component = nullptr;
  std::vector<const ValueExpr *> args;
  SourceRange range;
};

/// Right-hand side of a binding or an invocation argument.
struct PortSource
{
  enum class Kind : uint8_t {
    Own,         ///< data input of the component
    Invocation,  ///< `inv.port`
    Constant,    ///< literal, valid at every time
  };

  Kind kind = Kind::Own;
  std::string_view invocation;
  std::string_view port;
  int64_t constant = 0;
  SourceRange range;
};

struct InvocationDef
{
  std::string_view name;
  std::string_view instance;
  TimeExpr time;
  std::vector<PortSource> args;
  SourceRange range;
};

struct BindingDef
{
  std::string_view output;
  PortSource src;
  SourceRange range;
};

struct ComponentDef
{
  std::string_view name;
  bool is_extern = false;
  SourceRange range;

  std::vector<std::string_view> params;
  std::string_view event;
  const ValueExpr * delay = nullptr;
  SourceRange delay_range;

  std::vector<PortDef> inputs;
  std::vector<PortDef> outputs;
  std::vector<ExistentialDef> existentials;
  std::vector<Guard> guards;

  std::vector<InstanceDef> instances;
  std::vector<InvocationDef> invocations;
  std::vector<BindingDef> bindings;

  [[nodiscard]] const PortDef * find_input(std::string_view n) const;
  [[nodiscard]] const PortDef * find_output(std::string_view n) const;
  [[nodiscard]] const ExistentialDef * find_existential(std::string_view n) const;
  [[nodiscard]] const InstanceDef * find_instance(std::string_view n) const;
  [[nodiscard]] const InvocationDef * find_invocation(std::string_view n) const;

  /// Inputs that carry data, in declaration order (the invocation arguments).
  [[nodiscard]] std::vector<const PortDef *> data_inputs() const;
};

/**
 * Owner of all component definitions of a compilation, and of the
 * expression pool their expressions live in.
 */
class ComponentTable
{
public:
  ComponentTable() : pool_(std::make_unique<ExprPool>()) {}

  ComponentTable(const ComponentTable &) = delete;
  ComponentTable & operator=(const ComponentTable &) = delete;
  ComponentTable(ComponentTable &&) noexcept = default;
  ComponentTable & operator=(ComponentTable &&) noexcept = default;

  /// Create an empty definition; nullptr if the name is taken.
  ComponentDef * create(std::string_view name);

  [[nodiscard]] const ComponentDef * find(std::string_view name) const;
  [[nodiscard]] ComponentDef * find(std::string_view name);

  /// Definitions in creation order.
  [[nodiscard]] const std::vector<std::unique_ptr<ComponentDef>> & components() const
  {
    return defs_;
  }

  [[nodiscard]] size_t size() const noexcept { return defs_.size(); }

  [[nodiscard]] ExprPool & pool() const noexcept { return *pool_; }

private:
  std::unique_ptr<ExprPool> pool_;
  std::vector<std::unique_ptr<ComponentDef>> defs_;
  std::unordered_map<std::string_view, ComponentDef *, StringViewHash, StringViewEqual> by_name_;
};

}  // namespace filament
