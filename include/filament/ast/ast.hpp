// filament/ast/ast.hpp - AST node classes for .fil sources
//
// LLVM/Clang style: every node carries a NodeKind and a static classof()
// so the casting utilities work. Nodes live in an AstContext arena and must
// stay trivially destructible (string_view and gsl::span only).
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "filament/ast/ast_enums.hpp"
#include "filament/basic/casting.hpp"
#include "filament/basic/source_manager.hpp"

namespace filament
{

struct Symbol;  // set by NameResolver

class InstanceStmt;
class InvokeStmt;
class ComponentDecl;
class ExistsDecl;
class PortDecl;

// ============================================================================
// Base Classes
// ============================================================================

class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base that supplies classof() for a concrete node.
 *
 * @tparam Derived The concrete node class
 * @tparam Base The category base (Expr, Stmt, Decl or AstNode)
 * @tparam K The NodeKind of Derived
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Reference to a value parameter or existential by name.
class NameExpr : public NodeBase<NameExpr, Expr, NodeKind::NameExpr>
{
public:
  std::string_view name;

  /// Set by NameResolver; nullptr before resolution or when unbound.
  const Symbol * resolvedSymbol = nullptr;

  explicit NameExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Existential of a sub-instance: `inst.L` (an invocation name also works).
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::MemberExpr>
{
public:
  std::string_view base;
  std::string_view member;

  /// Instance the reference goes through (set by NameResolver).
  const InstanceStmt * resolvedInstance = nullptr;

  MemberExpr(std::string_view b, std::string_view m, SourceRange r = {})
  : NodeBase(r), base(b), member(m)
  {
  }
};

/// Arithmetic, or a comparison when used as a guard.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r_, SourceRange r = {})
  : NodeBase(r), lhs(l), op(o), rhs(r_)
  {
  }
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Builtin fn;
  Expr * arg;

  CallExpr(Builtin f, Expr * a, SourceRange r = {}) : NodeBase(r), fn(f), arg(a) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class ParamDecl : public NodeBase<ParamDecl, AstNode, NodeKind::ParamDecl>
{
public:
  std::string_view name;

  explicit ParamDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `<G: delay>`: the component's event and the cycles before it may retrigger.
class TimeParamDecl : public NodeBase<TimeParamDecl, AstNode, NodeKind::TimeParamDecl>
{
public:
  std::string_view name;
  Expr * delay;

  TimeParamDecl(std::string_view n, Expr * d, SourceRange r = {}) : NodeBase(r), name(n), delay(d)
  {
  }
};

/// `G` or `G + expr`.
class TimePoint : public NodeBase<TimePoint, AstNode, NodeKind::TimePoint>
{
public:
  std::string_view event;
  Expr * offset = nullptr;  ///< nullptr means +0
  SourceRange eventRange;

  TimePoint(std::string_view e, Expr * off, SourceRange r = {})
  : NodeBase(r), event(e), offset(off)
  {
  }
};

/**
 * Port of a component signature.
 *
 * Interface ports (`go: interface[G]`) have only `start`; all others carry
 * the interval `[start, end]` and a width expression.
 */
class PortDecl : public NodeBase<PortDecl, AstNode, NodeKind::PortDecl>
{
public:
  std::string_view name;
  PortDirection direction;
  bool isInterface = false;
  TimePoint * start = nullptr;
  TimePoint * end = nullptr;
  Expr * width = nullptr;

  PortDecl(std::string_view n, PortDirection dir, SourceRange r = {})
  : NodeBase(r), name(n), direction(dir)
  {
  }
};

/// Existential declared in a `with` block.
class ExistsDecl : public NodeBase<ExistsDecl, AstNode, NodeKind::ExistsDecl>
{
public:
  std::string_view name;
  Expr * definition = nullptr;  ///< `exists L = expr`
  gsl::span<Expr *> guards;     ///< `where L > 0, ...`

  explicit ExistsDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Port reference in an invocation argument or a binding: `a`, `inv.out`, `1`.
class PortRef : public NodeBase<PortRef, AstNode, NodeKind::PortRef>
{
public:
  std::string_view invocation;  ///< empty for ports of the enclosing component
  std::string_view port;
  bool isConstant = false;
  int64_t constant = 0;

  const PortDecl * resolvedPort = nullptr;
  const InvokeStmt * resolvedInvoke = nullptr;

  PortRef(std::string_view inv, std::string_view p, SourceRange r = {})
  : NodeBase(r), invocation(inv), port(p)
  {
  }

  [[nodiscard]] bool is_own_port() const noexcept { return !isConstant && invocation.empty(); }
};

// ============================================================================
// Statements
// ============================================================================

/// `name := new Component[args];`
class InstanceStmt : public NodeBase<InstanceStmt, Stmt, NodeKind::InstanceStmt>
{
public:
  std::string_view name;
  std::string_view component;
  SourceRange componentRange;
  gsl::span<Expr *> args;

  const ComponentDecl * resolvedComponent = nullptr;

  InstanceStmt(std::string_view n, std::string_view comp, SourceRange r = {})
  : NodeBase(r), name(n), component(comp)
  {
  }
};

/// `name := Instance<time>(args);`
class InvokeStmt : public NodeBase<InvokeStmt, Stmt, NodeKind::InvokeStmt>
{
public:
  std::string_view name;
  std::string_view instance;
  SourceRange instanceRange;
  TimePoint * time = nullptr;
  gsl::span<PortRef *> args;

  const InstanceStmt * resolvedInstance = nullptr;

  InvokeStmt(std::string_view n, std::string_view inst, SourceRange r = {})
  : NodeBase(r), name(n), instance(inst)
  {
  }
};

/// `dst = src;`
class ConnectStmt : public NodeBase<ConnectStmt, Stmt, NodeKind::ConnectStmt>
{
public:
  PortRef * dst;
  PortRef * src;

  ConnectStmt(PortRef * d, PortRef * s, SourceRange r = {}) : NodeBase(r), dst(d), src(s) {}
};

/// `exists L = expr;` inside a body.
class ExistsDefStmt : public NodeBase<ExistsDefStmt, Stmt, NodeKind::ExistsDefStmt>
{
public:
  std::string_view name;
  Expr * value;

  const ExistsDecl * resolvedExists = nullptr;

  ExistsDefStmt(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v)
  {
  }
};

// ============================================================================
// Declarations
// ============================================================================

class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::ImportDecl>
{
public:
  std::string_view path;

  explicit ImportDecl(std::string_view p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

class ComponentDecl : public NodeBase<ComponentDecl, Decl, NodeKind::ComponentDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  bool isExtern = false;
  gsl::span<ParamDecl *> params;
  TimeParamDecl * timeParam = nullptr;
  gsl::span<PortDecl *> inputs;
  gsl::span<PortDecl *> outputs;
  gsl::span<ExistsDecl *> existentials;
  gsl::span<Expr *> guards;
  gsl::span<Stmt *> body;

  explicit ComponentDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<ImportDecl *> imports;
  gsl::span<ComponentDecl *> components;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

}  // namespace filament
