// filament/sema/resolution/symbol_table.hpp - Scopes and symbols
//
// Components live in one global scope shared by every module of the graph.
// Each component owns a signature scope (value parameters, its event,
// existentials) and a body scope nested inside it (ports, instances,
// invocations).
//
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "filament/ast/ast.hpp"

namespace filament
{

enum class SymbolKind : uint8_t {
  Component,
  Param,        ///< value parameter `[W]`
  Event,        ///< time parameter `<G: ...>`
  Existential,  ///< `exists L`
  Port,
  Instance,    ///< `M := new Mul[...]`
  Invocation,  ///< `m0 := M<G>(...)`
};

[[nodiscard]] constexpr std::string_view to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Component:
      return "component";
    case SymbolKind::Param:
      return "parameter";
    case SymbolKind::Event:
      return "event";
    case SymbolKind::Existential:
      return "existential";
    case SymbolKind::Port:
      return "port";
    case SymbolKind::Instance:
      return "instance";
    case SymbolKind::Invocation:
      return "invocation";
  }
  return "symbol";
}

struct Symbol
{
  std::string_view name;
  SymbolKind kind;
  SourceRange definitionRange;

  /// ComponentDecl, ParamDecl, TimeParamDecl, ExistsDecl, PortDecl,
  /// InstanceStmt or InvokeStmt, according to `kind`.
  const AstNode * astNode = nullptr;
};

struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// Scope
// ============================================================================

/**
 * A lexical scope. Keys are interned names owned by an AstContext.
 */
class Scope
{
public:
  explicit Scope(Scope * parent = nullptr) : parent_(parent) {}

  /// @return the existing symbol when `symbol.name` is already defined
  ///         here or in a parent, nullptr on success
  const Symbol * define(Symbol symbol);

  [[nodiscard]] const Symbol * lookup_local(std::string_view name) const
  {
    auto it = symbols_.find(name);
    return it != symbols_.end() ? &it->second : nullptr;
  }

  [[nodiscard]] const Symbol * lookup(std::string_view name) const
  {
    if (const Symbol * sym = lookup_local(name)) {
      return sym;
    }
    return parent_ ? parent_->lookup(name) : nullptr;
  }

  [[nodiscard]] Scope * get_parent() const noexcept { return parent_; }
  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }

private:
  Scope * parent_;
  std::unordered_map<std::string_view, Symbol, StringViewHash, StringViewEqual> symbols_;
};

// ============================================================================
// SymbolTable
// ============================================================================

class SymbolTable
{
public:
  SymbolTable() : global_scope_(std::make_unique<Scope>()) {}

  [[nodiscard]] Scope * get_global_scope() noexcept { return global_scope_.get(); }
  [[nodiscard]] const Scope * get_global_scope() const noexcept { return global_scope_.get(); }

  /// Component declaration by name (any module), or nullptr.
  [[nodiscard]] const ComponentDecl * find_component(std::string_view name) const;

  /// Create the signature and body scopes of a component.
  void create_component_scopes(const ComponentDecl * comp);

  [[nodiscard]] Scope * get_signature_scope(const ComponentDecl * comp) const;
  [[nodiscard]] Scope * get_body_scope(const ComponentDecl * comp) const;

  /// Components in definition order.
  [[nodiscard]] const std::vector<const ComponentDecl *> & components() const noexcept
  {
    return components_;
  }

private:
  struct ComponentScopes
  {
    std::unique_ptr<Scope> signature;
    std::unique_ptr<Scope> body;
  };

  std::unique_ptr<Scope> global_scope_;
  std::unordered_map<const ComponentDecl *, ComponentScopes> component_scopes_;
  std::vector<const ComponentDecl *> components_;
};

}  // namespace filament
