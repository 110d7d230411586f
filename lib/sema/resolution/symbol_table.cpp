// filament/sema/symbol_table.cpp - Symbol table implementation
//
#include "filament/sema/resolution/symbol_table.hpp"

#include "filament/basic/casting.hpp"

namespace filament
{

const Symbol * Scope::define(Symbol symbol)
{
  if (const Symbol * existing = lookup(symbol.name)) {
    return existing;
  }
  symbols_.emplace(symbol.name, symbol);
  return nullptr;
}

const ComponentDecl * SymbolTable::find_component(std::string_view name) const
{
  const Symbol * sym = global_scope_->lookup_local(name);
  if (sym == nullptr || sym->kind != SymbolKind::Component) {
    return nullptr;
  }
  return cast<ComponentDecl>(sym->astNode);
}

void SymbolTable::create_component_scopes(const ComponentDecl * comp)
{
  if (component_scopes_.count(comp) > 0) {
    return;
  }
  ComponentScopes scopes;
  // Value names never see component names, so the signature scope is a root.
  scopes.signature = std::make_unique<Scope>();
  scopes.body = std::make_unique<Scope>(scopes.signature.get());
  component_scopes_.emplace(comp, std::move(scopes));
  components_.push_back(comp);
}

Scope * SymbolTable::get_signature_scope(const ComponentDecl * comp) const
{
  auto it = component_scopes_.find(comp);
  return it != component_scopes_.end() ? it->second.signature.get() : nullptr;
}

Scope * SymbolTable::get_body_scope(const ComponentDecl * comp) const
{
  auto it = component_scopes_.find(comp);
  return it != component_scopes_.end() ? it->second.body.get() : nullptr;
}

}  // namespace filament
