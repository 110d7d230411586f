// filament/sema/model/expr.cpp - Value expression interning and folding
//
#include "filament/sema/model/expr.hpp"

#include <algorithm>
#include <cstring>

namespace filament
{

namespace
{

size_t hash_combine(size_t seed, size_t v) noexcept
{
  return seed ^ (v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

std::optional<int64_t> fold_arith(BinaryOp op, int64_t a, int64_t b)
{
  int64_t out = 0;
  switch (op) {
    case BinaryOp::Add:
      if (__builtin_add_overflow(a, b, &out)) return std::nullopt;
      return out;
    case BinaryOp::Sub:
      if (__builtin_sub_overflow(a, b, &out)) return std::nullopt;
      return out;
    case BinaryOp::Mul:
      if (__builtin_mul_overflow(a, b, &out)) return std::nullopt;
      return out;
    case BinaryOp::Div:
      if (b == 0) return std::nullopt;
      return a / b;
    case BinaryOp::Mod:
      if (b == 0) return std::nullopt;
      return a % b;
    default:
      return std::nullopt;
  }
}

bool is_commutative(BinaryOp op) { return op == BinaryOp::Add || op == BinaryOp::Mul; }

int precedence(const ValueExpr * e)
{
  if (e->kind != ExprKind::Binary) return 3;
  return (e->op == BinaryOp::Add || e->op == BinaryOp::Sub) ? 1 : 2;
}

void render_into(const ValueExpr * e, std::string & out)
{
  switch (e->kind) {
    case ExprKind::Const:
      out += std::to_string(e->value);
      return;
    case ExprKind::Var:
      if (e->var_kind == VarKind::InstanceExist) {
        out.append(e->instance);
        out += '.';
      }
      out.append(e->name);
      return;
    case ExprKind::Call:
      out.append(to_string(e->fn));
      out += '(';
      render_into(e->arg, out);
      out += ')';
      return;
    case ExprKind::Binary: {
      const int prec = precedence(e);
      const bool lhs_parens = precedence(e->lhs) < prec;
      const bool rhs_parens = precedence(e->rhs) < prec ||
                              (precedence(e->rhs) == prec && !is_commutative(e->op));
      if (lhs_parens) out += '(';
      render_into(e->lhs, out);
      if (lhs_parens) out += ')';
      out.append(to_string(e->op));
      if (rhs_parens) out += '(';
      render_into(e->rhs, out);
      if (rhs_parens) out += ')';
      return;
    }
  }
}

}  // namespace

// ============================================================================
// Interning
// ============================================================================

size_t ExprPool::NodeHash::operator()(const ValueExpr * e) const noexcept
{
  size_t h = std::hash<int>{}(static_cast<int>(e->kind));
  switch (e->kind) {
    case ExprKind::Const:
      return hash_combine(h, std::hash<int64_t>{}(e->value));
    case ExprKind::Var:
      h = hash_combine(h, static_cast<size_t>(e->var_kind));
      h = hash_combine(h, std::hash<std::string_view>{}(e->name));
      return hash_combine(h, std::hash<std::string_view>{}(e->instance));
    case ExprKind::Binary:
      h = hash_combine(h, static_cast<size_t>(e->op));
      h = hash_combine(h, std::hash<const void *>{}(e->lhs));
      return hash_combine(h, std::hash<const void *>{}(e->rhs));
    case ExprKind::Call:
      h = hash_combine(h, static_cast<size_t>(e->fn));
      return hash_combine(h, std::hash<const void *>{}(e->arg));
  }
  return h;
}

bool ExprPool::NodeEqual::operator()(const ValueExpr * a, const ValueExpr * b) const noexcept
{
  if (a->kind != b->kind) return false;
  switch (a->kind) {
    case ExprKind::Const:
      return a->value == b->value;
    case ExprKind::Var:
      return a->var_kind == b->var_kind && a->name == b->name && a->instance == b->instance;
    case ExprKind::Binary:
      return a->op == b->op && a->lhs == b->lhs && a->rhs == b->rhs;
    case ExprKind::Call:
      return a->fn == b->fn && a->arg == b->arg;
  }
  return false;
}

const ValueExpr * ExprPool::intern_node(const ValueExpr & proto)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = nodes_.find(&proto); it != nodes_.end()) {
    return *it;
  }
  void * const mem = arena_.allocate(sizeof(ValueExpr), alignof(ValueExpr));
  auto * node = new (mem) ValueExpr(proto);
  nodes_.insert(node);
  return node;
}

std::string_view ExprPool::intern(std::string_view s)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = names_.find(s); it != names_.end()) {
    return *it;
  }
  char * const ptr = static_cast<char *>(arena_.allocate(s.empty() ? 1 : s.size(), 1));
  std::memcpy(ptr, s.data(), s.size());
  const std::string_view stored(ptr, s.size());
  names_.insert(stored);
  return stored;
}

size_t ExprPool::size() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return nodes_.size();
}

// ============================================================================
// Constructors
// ============================================================================

const ValueExpr * ExprPool::constant(int64_t value)
{
  ValueExpr proto;
  proto.kind = ExprKind::Const;
  proto.value = value;
  return intern_node(proto);
}

const ValueExpr * ExprPool::var(VarKind kind, std::string_view name, std::string_view instance)
{
  ValueExpr proto;
  proto.kind = ExprKind::Var;
  proto.var_kind = kind;
  proto.name = intern(name);
  proto.instance = instance.empty() ? std::string_view{} : intern(instance);
  return intern_node(proto);
}

const ValueExpr * ExprPool::param(std::string_view name) { return var(VarKind::Param, name); }

const ValueExpr * ExprPool::exist(std::string_view name) { return var(VarKind::Exist, name); }

const ValueExpr * ExprPool::instance_exist(std::string_view instance, std::string_view name)
{
  return var(VarKind::InstanceExist, name, instance);
}

const ValueExpr * ExprPool::binary(BinaryOp op, const ValueExpr * lhs, const ValueExpr * rhs)
{
  if (lhs->is_const() && rhs->is_const()) {
    if (auto v = fold_arith(op, lhs->value, rhs->value)) {
      return constant(*v);
    }
  }

  // Constants go to the right of commutative operators.
  if (is_commutative(op) && lhs->is_const() && !rhs->is_const()) {
    std::swap(lhs, rhs);
  }

  switch (op) {
    case BinaryOp::Add:
      if (rhs->is_const(0)) return lhs;
      // (x + c1) + c2 => x + (c1 + c2)
      if (
        rhs->is_const() && lhs->kind == ExprKind::Binary && lhs->op == BinaryOp::Add &&
        lhs->rhs->is_const()) {
        return add(lhs->lhs, add(lhs->rhs, rhs));
      }
      // x + (y + c) => (x + y) + c
      if (rhs->kind == ExprKind::Binary && rhs->op == BinaryOp::Add && rhs->rhs->is_const()) {
        return add(add(lhs, rhs->lhs), rhs->rhs);
      }
      break;
    case BinaryOp::Sub:
      if (rhs->is_const(0)) return lhs;
      if (lhs == rhs) return constant(0);
      // (x + c1) - c2 => x + (c1 - c2) when that stays non-negative
      if (
        rhs->is_const() && lhs->kind == ExprKind::Binary && lhs->op == BinaryOp::Add &&
        lhs->rhs->is_const() && lhs->rhs->value >= rhs->value) {
        return add(lhs->lhs, constant(lhs->rhs->value - rhs->value));
      }
      // (x + y) - y => x, (x + c) - x => c
      if (lhs->kind == ExprKind::Binary && lhs->op == BinaryOp::Add) {
        if (lhs->rhs == rhs) return lhs->lhs;
        if (lhs->lhs == rhs) return lhs->rhs;
      }
      // (x + c1) - (x + c2) => c1 - c2, x - (x + c) => -c
      if (rhs->kind == ExprKind::Binary && rhs->op == BinaryOp::Add && rhs->rhs->is_const()) {
        if (rhs->lhs == lhs) return constant(-rhs->rhs->value);
        if (
          lhs->kind == ExprKind::Binary && lhs->op == BinaryOp::Add && lhs->lhs == rhs->lhs &&
          lhs->rhs->is_const()) {
          return constant(lhs->rhs->value - rhs->rhs->value);
        }
      }
      break;
    case BinaryOp::Mul:
      if (rhs->is_const(1)) return lhs;
      if (rhs->is_const(0)) return rhs;
      break;
    case BinaryOp::Div:
      if (rhs->is_const(1)) return lhs;
      break;
    case BinaryOp::Mod:
      if (rhs->is_const(1)) return constant(0);
      break;
    default:
      break;
  }

  ValueExpr proto;
  proto.kind = ExprKind::Binary;
  proto.op = op;
  proto.lhs = lhs;
  proto.rhs = rhs;
  return intern_node(proto);
}

const ValueExpr * ExprPool::call(Builtin fn, const ValueExpr * arg)
{
  if (arg->is_const()) {
    if (auto v = apply_builtin(fn, arg->value)) {
      return constant(*v);
    }
  }
  ValueExpr proto;
  proto.kind = ExprKind::Call;
  proto.fn = fn;
  proto.arg = arg;
  return intern_node(proto);
}

// ============================================================================
// Substitution
// ============================================================================

const ValueExpr * ExprPool::substitute(const ValueExpr * expr, const Substitution & subst)
{
  if (subst.empty()) return expr;

  switch (expr->kind) {
    case ExprKind::Const:
      return expr;
    case ExprKind::Var: {
      auto it = subst.find(expr);
      return it != subst.end() ? it->second : expr;
    }
    case ExprKind::Binary: {
      const ValueExpr * l = substitute(expr->lhs, subst);
      const ValueExpr * r = substitute(expr->rhs, subst);
      if (l == expr->lhs && r == expr->rhs) return expr;
      return binary(expr->op, l, r);
    }
    case ExprKind::Call: {
      const ValueExpr * a = substitute(expr->arg, subst);
      return a == expr->arg ? expr : call(expr->fn, a);
    }
  }
  return expr;
}

// ============================================================================
// Evaluation
// ============================================================================

std::optional<int64_t> apply_builtin(Builtin fn, int64_t arg)
{
  switch (fn) {
    case Builtin::Pow2:
      if (arg < 0 || arg > 62) return std::nullopt;
      return int64_t{1} << arg;
    case Builtin::Log2: {
      if (arg < 1) return std::nullopt;
      int64_t bits = 0;
      while ((int64_t{1} << bits) < arg) {
        ++bits;
      }
      return bits;
    }
  }
  return std::nullopt;
}

std::optional<int64_t> evaluate(const ValueExpr * expr, const Environment & env)
{
  switch (expr->kind) {
    case ExprKind::Const:
      return expr->value;
    case ExprKind::Var: {
      auto it = env.find(expr);
      if (it == env.end()) return std::nullopt;
      return it->second;
    }
    case ExprKind::Binary: {
      auto l = evaluate(expr->lhs, env);
      auto r = evaluate(expr->rhs, env);
      if (!l || !r) return std::nullopt;
      return fold_arith(expr->op, *l, *r);
    }
    case ExprKind::Call: {
      auto a = evaluate(expr->arg, env);
      if (!a) return std::nullopt;
      return apply_builtin(expr->fn, *a);
    }
  }
  return std::nullopt;
}

std::optional<int64_t> evaluate(const ValueExpr * expr)
{
  static const Environment empty;
  return evaluate(expr, empty);
}

// ============================================================================
// Inspection
// ============================================================================

void collect_vars(const ValueExpr * expr, std::vector<const ValueExpr *> & out)
{
  switch (expr->kind) {
    case ExprKind::Const:
      return;
    case ExprKind::Var:
      if (std::find(out.begin(), out.end(), expr) == out.end()) {
        out.push_back(expr);
      }
      return;
    case ExprKind::Binary:
      collect_vars(expr->lhs, out);
      collect_vars(expr->rhs, out);
      return;
    case ExprKind::Call:
      collect_vars(expr->arg, out);
      return;
  }
}

bool any_var(const ValueExpr * expr, const std::function<bool(const ValueExpr *)> & pred)
{
  switch (expr->kind) {
    case ExprKind::Const:
      return false;
    case ExprKind::Var:
      return pred(expr);
    case ExprKind::Binary:
      return any_var(expr->lhs, pred) || any_var(expr->rhs, pred);
    case ExprKind::Call:
      return any_var(expr->arg, pred);
  }
  return false;
}

std::string render(const ValueExpr * expr)
{
  std::string out;
  render_into(expr, out);
  return out;
}

}  // namespace filament
