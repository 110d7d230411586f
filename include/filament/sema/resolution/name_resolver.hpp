// filament/sema/resolution/name_resolver.hpp - Name resolution visitor
//
// Binds every identifier of a module to its declaration, recording the
// result in the AST (resolvedSymbol, resolvedComponent, resolvedPort, ...).
//
#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

#include "filament/ast/ast.hpp"
#include "filament/ast/visitor.hpp"
#include "filament/basic/diagnostic.hpp"
#include "filament/sema/resolution/symbol_table.hpp"

namespace filament
{

/**
 * Name resolution pass. Runs after SymbolTableBuilder has registered every
 * component of the module graph.
 *
 * Scoping rules:
 * - Signature expressions (delay, port intervals and widths, guards,
 *   existential definitions) see value parameters and own existentials.
 * - Instance arguments see value parameters only.
 * - Body expressions additionally see `instance.L` existentials of
 *   sub-instances (through an instance or an invocation name).
 * - Every time point must use the component's own event.
 *
 * Unresolvable references are reported as ErrorKind::UnboundIdentifier.
 */
class NameResolver : public AstVisitor<NameResolver>
{
public:
  NameResolver(const SymbolTable & symbols, DiagnosticBag * diags = nullptr)
  : symbols_(symbols), diags_(diags)
  {
  }

  /// Resolve all names in one module.
  bool resolve(Program & program);

  // Expressions
  void visit_name_expr(NameExpr * node);
  void visit_member_expr(MemberExpr * node);
  void visit_binary_expr(BinaryExpr * node);
  void visit_call_expr(CallExpr * node);

  // Statements
  void visit_instance_stmt(InstanceStmt * node);
  void visit_invoke_stmt(InvokeStmt * node);
  void visit_connect_stmt(ConnectStmt * node);
  void visit_exists_def_stmt(ExistsDefStmt * node);

  // Declarations and supporting nodes
  void visit_component_decl(ComponentDecl * node);
  void visit_time_point(TimePoint * node);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  enum class ExprContext : uint8_t {
    Signature,
    InstanceArgs,
    Body,
  };

  /// Where a port reference appears.
  enum class PortRole : uint8_t {
    Source,  ///< invocation argument or right side of a binding
    Sink,    ///< left side of a binding
  };

  void resolve_port_ref(PortRef * ref, PortRole role);
  [[nodiscard]] const InstanceStmt * instance_through(std::string_view name) const;

  void report_error(SourceRange range, std::string message, std::string label = "");

  const SymbolTable & symbols_;
  DiagnosticBag * diags_;

  const ComponentDecl * current_ = nullptr;
  ExprContext context_ = ExprContext::Signature;
  std::unordered_set<std::string_view> defined_in_body_;

  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace filament
