// filament/sema/symbol_table_builder.cpp - Declaration registration
//
#include "filament/sema/resolution/symbol_table_builder.hpp"

#include <string>

#include "filament/basic/casting.hpp"

namespace filament
{

bool SymbolTableBuilder::build(const Program & program)
{
  has_errors_ = false;
  error_count_ = 0;

  for (const auto * comp : program.components) {
    register_component(*comp);
  }
  return !has_errors_;
}

void SymbolTableBuilder::register_component(const ComponentDecl & comp)
{
  define(
    symbols_.get_global_scope(), Symbol{comp.name, SymbolKind::Component, comp.nameRange, &comp});

  symbols_.create_component_scopes(&comp);
  Scope * sig = symbols_.get_signature_scope(&comp);
  Scope * body = symbols_.get_body_scope(&comp);

  for (const auto * p : comp.params) {
    define(sig, Symbol{p->name, SymbolKind::Param, p->get_range(), p});
  }
  if (comp.timeParam != nullptr) {
    define(
      sig,
      Symbol{comp.timeParam->name, SymbolKind::Event, comp.timeParam->get_range(), comp.timeParam});
  }
  for (const auto * e : comp.existentials) {
    define(sig, Symbol{e->name, SymbolKind::Existential, e->get_range(), e});
  }

  for (const auto * port : comp.inputs) {
    define(body, Symbol{port->name, SymbolKind::Port, port->get_range(), port});
  }
  for (const auto * port : comp.outputs) {
    define(body, Symbol{port->name, SymbolKind::Port, port->get_range(), port});
  }

  for (const auto * stmt : comp.body) {
    if (const auto * inst = dyn_cast<InstanceStmt>(stmt)) {
      define(body, Symbol{inst->name, SymbolKind::Instance, inst->get_range(), inst});
    } else if (const auto * inv = dyn_cast<InvokeStmt>(stmt)) {
      define(body, Symbol{inv->name, SymbolKind::Invocation, inv->get_range(), inv});
    }
  }
}

void SymbolTableBuilder::define(Scope * scope, const Symbol & symbol)
{
  if (const Symbol * previous = scope->define(symbol)) {
    report_duplicate(symbol, *previous);
  }
}

void SymbolTableBuilder::report_duplicate(const Symbol & symbol, const Symbol & previous)
{
  has_errors_ = true;
  error_count_++;
  if (diags_ == nullptr) {
    return;
  }
  diags_
    ->report(
      ErrorKind::DuplicateDefinition, symbol.definitionRange,
      "'" + std::string(symbol.name) + "' is already defined", "redefined here")
    .with_secondary_label(
      previous.definitionRange,
      "previous definition as " + std::string(to_string(previous.kind)));
}

}  // namespace filament
