// filament/sema/model/expr.hpp - Interned value expressions
//
// Value expressions are the natural-valued terms of the temporal type
// system: widths, delays, time offsets, guards and existential
// definitions. They are hash-consed by ExprPool, so two structurally equal
// expressions are the same pointer.
//
#pragma once

#include <cstdint>
#include <functional>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "filament/ast/ast_enums.hpp"

namespace filament
{

// ============================================================================
// ValueExpr
// ============================================================================

enum class ExprKind : uint8_t {
  Const,
  Var,
  Binary,
  Call,
};

enum class VarKind : uint8_t {
  Param,          ///< value parameter of the enclosing component
  Exist,          ///< existential of the enclosing component
  InstanceExist,  ///< `instance.name`, keyed by the sub-instance name
};

/**
 * Immutable value expression.
 *
 * Only the fields relevant to `kind` are meaningful. Instance existentials
 * are keys (`instance`, `name`) into the enclosing component's instance
 * table and never point at the instance itself.
 */
struct ValueExpr
{
  ExprKind kind = ExprKind::Const;

  /// Const
  int64_t value = 0;

  /// Var
  VarKind var_kind = VarKind::Param;
  std::string_view name;
  std::string_view instance;

  /// Binary
  BinaryOp op = BinaryOp::Add;
  const ValueExpr * lhs = nullptr;
  const ValueExpr * rhs = nullptr;

  /// Call
  Builtin fn = Builtin::Pow2;
  const ValueExpr * arg = nullptr;

  [[nodiscard]] bool is_const() const noexcept { return kind == ExprKind::Const; }
  [[nodiscard]] bool is_var() const noexcept { return kind == ExprKind::Var; }
  [[nodiscard]] bool is_const(int64_t v) const noexcept { return is_const() && value == v; }
};

/// Simultaneous substitution: variable node -> replacement.
using Substitution = std::unordered_map<const ValueExpr *, const ValueExpr *>;

/// Concrete values for variables.
using Environment = std::unordered_map<const ValueExpr *, int64_t>;

// ============================================================================
// ExprPool
// ============================================================================

/**
 * Owner and interner of value expressions.
 *
 * All constructors fold ground arithmetic (`2*2` is the constant `4`) and
 * neutral elements (`x+0`, `x*1`). The pool is shared by every pass of a
 * compilation and may be used from several threads.
 */
class ExprPool
{
public:
  ExprPool() = default;

  ExprPool(const ExprPool &) = delete;
  ExprPool & operator=(const ExprPool &) = delete;

  // ===========================================================================
  // Construction (Interned)
  // ===========================================================================

  const ValueExpr * constant(int64_t value);
  const ValueExpr * param(std::string_view name);
  const ValueExpr * exist(std::string_view name);
  const ValueExpr * instance_exist(std::string_view instance, std::string_view name);
  const ValueExpr * var(VarKind kind, std::string_view name, std::string_view instance = {});

  const ValueExpr * binary(BinaryOp op, const ValueExpr * lhs, const ValueExpr * rhs);
  const ValueExpr * call(Builtin fn, const ValueExpr * arg);

  const ValueExpr * add(const ValueExpr * l, const ValueExpr * r)
  {
    return binary(BinaryOp::Add, l, r);
  }
  const ValueExpr * mul(const ValueExpr * l, const ValueExpr * r)
  {
    return binary(BinaryOp::Mul, l, r);
  }

  /// Intern a name into pool-owned storage.
  [[nodiscard]] std::string_view intern(std::string_view s);

  // ===========================================================================
  // Operations
  // ===========================================================================

  /// Replace variables simultaneously; the result is re-folded.
  const ValueExpr * substitute(const ValueExpr * expr, const Substitution & subst);

  /// Number of distinct expressions created so far.
  [[nodiscard]] size_t size() const;

private:
  struct NodeHash
  {
    size_t operator()(const ValueExpr * e) const noexcept;
  };
  struct NodeEqual
  {
    bool operator()(const ValueExpr * a, const ValueExpr * b) const noexcept;
  };

  const ValueExpr * intern_node(const ValueExpr & proto);

  mutable std::mutex mutex_;
  std::pmr::monotonic_buffer_resource arena_{8192};
  std::pmr::unordered_set<std::string_view> names_{&arena_};
  std::pmr::unordered_set<const ValueExpr *, NodeHash, NodeEqual> nodes_{&arena_};
};

// ============================================================================
// Free functions
// ============================================================================

/// Evaluate under `env`; nullopt if a variable is unbound or on division by zero.
[[nodiscard]] std::optional<int64_t> evaluate(const ValueExpr * expr, const Environment & env);

/// Evaluate a ground expression.
[[nodiscard]] std::optional<int64_t> evaluate(const ValueExpr * expr);

/// Concrete semantics of the builtins: `2^n` and `ceil(log2 n)`.
[[nodiscard]] std::optional<int64_t> apply_builtin(Builtin fn, int64_t arg);

/// Collect the variables of `expr` (each once, in first-occurrence order).
void collect_vars(const ValueExpr * expr, std::vector<const ValueExpr *> & out);

/// True if `pred` holds for some variable of `expr`.
[[nodiscard]] bool any_var(
  const ValueExpr * expr, const std::function<bool(const ValueExpr *)> & pred);

/// Compact rendering with minimal parentheses: `W`, `M2.L`, `(N+1)*W`.
[[nodiscard]] std::string render(const ValueExpr * expr);

}  // namespace filament
