// filament/sema/resolution/symbol_table_builder.hpp - Symbol table construction
//
// Registers every declaration before NameResolver runs, so references are
// order independent (an invocation may name an instance declared later in
// the body, a component may instantiate one defined in another module).
//
#pragma once

#include <string_view>

#include "filament/ast/ast.hpp"
#include "filament/basic/diagnostic.hpp"
#include "filament/sema/resolution/symbol_table.hpp"

namespace filament
{

class SymbolTableBuilder
{
public:
  SymbolTableBuilder(SymbolTable & symbols, DiagnosticBag * diags = nullptr)
  : symbols_(symbols), diags_(diags)
  {
  }

  /// Register the components of one module and their local names.
  bool build(const Program & program);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void register_component(const ComponentDecl & comp);
  void define(Scope * scope, const Symbol & symbol);

  void report_duplicate(const Symbol & symbol, const Symbol & previous);

  SymbolTable & symbols_;
  DiagnosticBag * diags_;
  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace filament
