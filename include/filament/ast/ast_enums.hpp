// filament/ast/ast_enums.hpp - AST enumerations
//
// Node kinds (generated from ast_nodes.def), operators and port
// directions shared by the AST and the semantic model.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace filament
{

// ============================================================================
// NodeKind
// ============================================================================

/// LLVM-style RTTI tag; categories are contiguous so classof can range-check.
enum class NodeKind : uint8_t {
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "filament/ast/ast_nodes.def"

#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "filament/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "filament/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "filament/ast/ast_nodes.def"

#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "filament/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

/// Binary operators of value expressions and guard comparisons.
enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
};

/// Builtin functions usable in value expressions.
enum class Builtin : uint8_t {
  Pow2,  ///< pow2(n) = 2^n
  Log2,  ///< log2(n) = ceil(log2(n))
};

enum class PortDirection : uint8_t {
  In,
  Out,
};

[[nodiscard]] constexpr bool is_comparison(BinaryOp op) noexcept
{
  return op >= BinaryOp::Eq;
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
  }
  return "?";
}

[[nodiscard]] constexpr std::string_view to_string(Builtin fn) noexcept
{
  switch (fn) {
    case Builtin::Pow2:
      return "pow2";
    case Builtin::Log2:
      return "log2";
  }
  return "?";
}

[[nodiscard]] constexpr std::string_view to_string(PortDirection dir) noexcept
{
  return dir == PortDirection::In ? "in" : "out";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::CallExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::InstanceStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ExistsDefStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::ImportDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::ComponentDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace filament
