// filament/sema/model/model_builder.hpp - Lower the resolved AST
//
// Turns every ComponentDecl of the module graph into a ComponentDef whose
// expressions live in the table's ExprPool. Runs after name resolution
// succeeded; the AST is not modified.
//
#pragma once

#include <optional>

#include "filament/ast/ast.hpp"
#include "filament/basic/diagnostic.hpp"
#include "filament/sema/model/component.hpp"
#include "filament/sema/resolution/module_graph.hpp"

namespace filament
{

class ModelBuilder
{
public:
  ModelBuilder(ComponentTable & table, DiagnosticBag * diags = nullptr)
  : table_(table), pool_(table.pool()), diags_(diags)
  {
  }

  /// Lower every module of the graph.
  bool build(const ModuleGraph & graph);

  /// Lower one program (tests and single-module use).
  bool build(const Program & program);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  void declare(const ComponentDecl & decl);
  void lower(const ComponentDecl & decl, ComponentDef & def);

  const ValueExpr * lower_expr(const Expr * expr);
  std::optional<Comparison> lower_comparison(const Expr * expr);
  TimeExpr lower_time(const TimePoint * tp, std::string_view event);
  PortDef lower_port(const PortDecl & port, std::string_view event);
  PortSource lower_source(const PortRef & ref);

  void report_error(ErrorKind kind, SourceRange range, std::string message);

  ComponentTable & table_;
  ExprPool & pool_;
  DiagnosticBag * diags_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace filament
