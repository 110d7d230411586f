// filament/ast/visitor.hpp - CRTP visitors over the AST
#pragma once

#include <type_traits>

#include "filament/ast/ast.hpp"
#include "filament/ast/ast_enums.hpp"
#include "filament/basic/casting.hpp"

namespace filament
{

namespace detail
{

/// Const-ness of NodePtrT carried over to the concrete node pointer.
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor
// ============================================================================

/**
 * Static-dispatch visitor. A derived class implements `visit_<snake>` for
 * the nodes it cares about; everything else falls through to the category
 * handlers (visit_expr, visit_stmt, visit_decl) and finally visit_node.
 *
 * @code
 *   struct CountLiterals : ConstAstVisitor<CountLiterals> {
 *     int n = 0;
 *     void visit_int_literal_expr(const IntLiteralExpr *) { ++n; }
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "filament/ast/ast_nodes.def"
    }
    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "filament/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor
// ============================================================================

/**
 * Visitor that walks into children. Returning false from any visit method
 * stops the traversal; an override that does not call the base prunes the
 * subtree.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  bool visit_node(NodePtrT /*node*/) { return true; }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_call_expr(NodePtr<CallExpr> node) { return get_derived().visit(node->arg); }

  bool visit_time_param_decl(NodePtr<TimeParamDecl> node)
  {
    return get_derived().visit(node->delay);
  }

  bool visit_time_point(NodePtr<TimePoint> node)
  {
    return !node->offset || get_derived().visit(node->offset);
  }

  bool visit_port_decl(NodePtr<PortDecl> node)
  {
    if (node->start && !get_derived().visit(node->start)) return false;
    if (node->end && !get_derived().visit(node->end)) return false;
    return !node->width || get_derived().visit(node->width);
  }

  bool visit_exists_decl(NodePtr<ExistsDecl> node)
  {
    if (node->definition && !get_derived().visit(node->definition)) return false;
    for (auto * g : node->guards) {
      if (!get_derived().visit(g)) return false;
    }
    return true;
  }

  bool visit_instance_stmt(NodePtr<InstanceStmt> node)
  {
    for (auto * a : node->args) {
      if (!get_derived().visit(a)) return false;
    }
    return true;
  }

  bool visit_invoke_stmt(NodePtr<InvokeStmt> node)
  {
    if (!get_derived().visit(node->time)) return false;
    for (auto * a : node->args) {
      if (!get_derived().visit(a)) return false;
    }
    return true;
  }

  bool visit_connect_stmt(NodePtr<ConnectStmt> node)
  {
    return get_derived().visit(node->dst) && get_derived().visit(node->src);
  }

  bool visit_exists_def_stmt(NodePtr<ExistsDefStmt> node)
  {
    return get_derived().visit(node->value);
  }

  bool visit_component_decl(NodePtr<ComponentDecl> node)
  {
    for (auto * p : node->params) {
      if (!get_derived().visit(p)) return false;
    }
    if (node->timeParam && !get_derived().visit(node->timeParam)) return false;
    for (auto * p : node->inputs) {
      if (!get_derived().visit(p)) return false;
    }
    for (auto * p : node->outputs) {
      if (!get_derived().visit(p)) return false;
    }
    for (auto * e : node->existentials) {
      if (!get_derived().visit(e)) return false;
    }
    for (auto * g : node->guards) {
      if (!get_derived().visit(g)) return false;
    }
    for (auto * s : node->body) {
      if (!get_derived().visit(s)) return false;
    }
    return true;
  }

  bool visit_program(NodePtr<Program> node)
  {
    for (auto * i : node->imports) {
      if (!get_derived().visit(i)) return false;
    }
    for (auto * c : node->components) {
      if (!get_derived().visit(c)) return false;
    }
    return true;
  }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace filament
