// filament/solver/solver_session.cpp - Z3 translation and queries
#include "filament/solver/solver_session.hpp"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <unordered_map>
#include <z3++.h>

namespace filament
{

std::atomic<size_t> SolverSession::total_queries_{0};

namespace
{

// Query dumps from concurrent sessions go to one file.
std::mutex g_dump_mutex;

using VarMap = std::unordered_map<const ValueExpr *, z3::expr>;

bool mentions_any(const Comparison & cmp, const std::vector<const ValueExpr *> & vars)
{
  auto in = [&](const ValueExpr * v) {
    return std::find(vars.begin(), vars.end(), v) != vars.end();
  };
  return any_var(cmp.lhs, in) || any_var(cmp.rhs, in);
}

bool mentions_any(const Implication & imp, const std::vector<const ValueExpr *> & vars)
{
  return mentions_any(imp.conclusion, vars) ||
         std::any_of(imp.premises.begin(), imp.premises.end(), [&](const Comparison & p) {
           return mentions_any(p, vars);
         });
}

}  // namespace

std::string_view to_string(SolverStatus status) noexcept
{
  switch (status) {
    case SolverStatus::Sat:
      return "sat";
    case SolverStatus::Unsat:
      return "unsat";
    case SolverStatus::Ambiguous:
      return "ambiguous";
    case SolverStatus::Unknown:
      return "unknown";
  }
  return "unknown";
}

std::string render(const Assignment & assignment)
{
  std::string out;
  for (const auto & [var, value] : assignment) {
    if (!out.empty()) out += ", ";
    out += render(var) + " = " + std::to_string(value);
  }
  return out;
}

// ============================================================================
// Impl
// ============================================================================

struct SolverSession::Impl
{
  z3::context ctx;
  z3::func_decl pow2;
  z3::func_decl log2;

  Impl()
  : pow2(ctx.function("pow2", ctx.int_sort(), ctx.int_sort())),
    log2(ctx.function("log2", ctx.int_sort(), ctx.int_sort()))
  {
  }

  z3::solver make_solver(const SolverOptions & options)
  {
    z3::solver s(ctx);
    if (options.timeout_ms != 0) {
      z3::params p(ctx);
      p.set("timeout", options.timeout_ms);
      s.set(p);
    }
    return s;
  }

  /// The Z3 constant for `var`; `suffix` distinguishes renamed copies.
  z3::expr declare(VarMap & vars, const ValueExpr * var, const std::string & suffix = "")
  {
    auto it = vars.find(var);
    if (it != vars.end()) return it->second;
    z3::expr c = ctx.int_const((render(var) + suffix).c_str());
    vars.emplace(var, c);
    return c;
  }

  z3::expr translate(const ValueExpr * e, VarMap & vars)
  {
    switch (e->kind) {
      case ExprKind::Const:
        return ctx.int_val(static_cast<int64_t>(e->value));
      case ExprKind::Var:
        return declare(vars, e);
      case ExprKind::Call: {
        z3::expr a = translate(e->arg, vars);
        return e->fn == Builtin::Pow2 ? pow2(a) : log2(a);
      }
      case ExprKind::Binary: {
        z3::expr l = translate(e->lhs, vars);
        z3::expr r = translate(e->rhs, vars);
        switch (e->op) {
          case BinaryOp::Add:
            return l + r;
          case BinaryOp::Sub:
            return l - r;
          case BinaryOp::Mul:
            return l * r;
          case BinaryOp::Div:
            return l / r;
          case BinaryOp::Mod:
            return z3::mod(l, r);
          default:
            break;
        }
        break;
      }
    }
    return ctx.int_val(0);
  }

  z3::expr translate(const Comparison & cmp, VarMap & vars)
  {
    z3::expr l = translate(cmp.lhs, vars);
    z3::expr r = translate(cmp.rhs, vars);
    switch (cmp.op) {
      case CmpOp::Eq:
        return l == r;
      case CmpOp::Ne:
        return l != r;
      case CmpOp::Lt:
        return l < r;
      case CmpOp::Le:
        return l <= r;
      case CmpOp::Gt:
        return l > r;
      case CmpOp::Ge:
        return l >= r;
    }
    return ctx.bool_val(true);
  }

  z3::expr translate(const Constraint & c, VarMap & vars)
  {
    z3::expr_vector parts(ctx);
    for (const auto & term : c.terms) {
      parts.push_back(translate(term, vars));
    }
    if (parts.empty()) return ctx.bool_val(true);
    return c.disjunctive ? z3::mk_or(parts) : z3::mk_and(parts);
  }

  z3::expr conjunction(const std::vector<Comparison> & cmps, VarMap & vars)
  {
    z3::expr_vector parts(ctx);
    for (const auto & cmp : cmps) {
      parts.push_back(translate(cmp, vars));
    }
    return parts.empty() ? ctx.bool_val(true) : z3::mk_and(parts);
  }

  z3::expr conjunction(const std::vector<Implication> & imps, VarMap & vars)
  {
    z3::expr_vector parts(ctx);
    for (const auto & imp : imps) {
      parts.push_back(z3::implies(conjunction(imp.premises, vars), translate(imp.conclusion, vars)));
    }
    return parts.empty() ? ctx.bool_val(true) : z3::mk_and(parts);
  }

  z3::expr conjunction(const std::vector<Constraint> & cs, VarMap & vars)
  {
    z3::expr_vector parts(ctx);
    for (const auto & c : cs) {
      parts.push_back(translate(c, vars));
    }
    return parts.empty() ? ctx.bool_val(true) : z3::mk_and(parts);
  }

  /// Every translated variable is a natural.
  z3::expr naturals(const VarMap & vars, const std::vector<const ValueExpr *> & which)
  {
    z3::expr_vector parts(ctx);
    for (const ValueExpr * v : which) {
      auto it = vars.find(v);
      if (it != vars.end()) parts.push_back(it->second >= 0);
    }
    return parts.empty() ? ctx.bool_val(true) : z3::mk_and(parts);
  }

  int64_t value_of(const z3::model & m, const z3::expr & e)
  {
    int64_t v = 0;
    if (!m.eval(e, true).is_numeral_i64(v)) {
      v = 0;
    }
    return v;
  }
};

// ============================================================================
// SolverSession
// ============================================================================

SolverSession::SolverSession(SolverOptions options)
: options_(std::move(options)), impl_(std::make_unique<Impl>())
{
}

SolverSession::~SolverSession() = default;

size_t SolverSession::total_queries() noexcept { return total_queries_.load(); }

namespace
{

std::vector<const ValueExpr *> vars_of(const SolverQuery & q)
{
  std::vector<const ValueExpr *> out;
  for (const auto & a : q.assumptions) {
    collect_vars(a.lhs, out);
    collect_vars(a.rhs, out);
  }
  for (const auto & imp : q.implications) {
    for (const auto & p : imp.premises) {
      collect_vars(p.lhs, out);
      collect_vars(p.rhs, out);
    }
    collect_vars(imp.conclusion.lhs, out);
    collect_vars(imp.conclusion.rhs, out);
  }
  for (const auto & c : q.constraints) {
    for (const auto & t : c.terms) {
      collect_vars(t.lhs, out);
      collect_vars(t.rhs, out);
    }
  }
  for (const ValueExpr * u : q.unknowns) {
    if (std::find(out.begin(), out.end(), u) == out.end()) out.push_back(u);
  }
  return out;
}

void dump_query(const std::string & path, const std::string & description, z3::solver & s)
{
  if (path.empty()) return;
  std::lock_guard<std::mutex> lock(g_dump_mutex);
  std::ofstream out(path, std::ios::app);
  out << "; " << description << "\n" << s.to_smt2() << "\n";
}

}  // namespace

ProofResult SolverSession::prove(const SolverQuery & query)
{
  ProofResult result;
  try {
    Impl & z = *impl_;
    VarMap vars;
    const std::vector<const ValueExpr *> all = vars_of(query);
    std::vector<const ValueExpr *> universals;
    for (const ValueExpr * v : all) {
      z.declare(vars, v);
      if (std::find(query.unknowns.begin(), query.unknowns.end(), v) == query.unknowns.end()) {
        universals.push_back(v);
      }
    }

    // Assumptions that talk about the unknowns constrain them instead.
    std::vector<Comparison> outer;
    std::vector<Comparison> inner;
    for (const auto & a : query.assumptions) {
      (mentions_any(a, query.unknowns) ? inner : outer).push_back(a);
    }
    std::vector<Implication> outer_imps;
    std::vector<Implication> inner_imps;
    for (const auto & imp : query.implications) {
      (mentions_any(imp, query.unknowns) ? inner_imps : outer_imps).push_back(imp);
    }

    z3::solver s = z.make_solver(options_);
    s.add(z.naturals(vars, universals));
    s.add(z.conjunction(outer, vars));
    s.add(z.conjunction(outer_imps, vars));

    const z3::expr goal = z.conjunction(query.constraints, vars);
    if (query.unknowns.empty()) {
      s.add(!goal);
    } else {
      z3::expr_vector bound(z.ctx);
      for (const ValueExpr * u : query.unknowns) {
        bound.push_back(vars.at(u));
      }
      const z3::expr body = z.naturals(vars, query.unknowns) && z.conjunction(inner, vars) &&
                            z.conjunction(inner_imps, vars) && goal;
      if (universals.empty()) {
        s.add(body);
      } else {
        s.add(z3::forall(bound, !body));
      }
    }

    dump_query(options_.dump_queries, query.description, s);
    ++query_count_;
    ++total_queries_;

    const z3::check_result r = s.check();
    const bool direct = !query.unknowns.empty() && universals.empty();
    if (r == z3::unknown) {
      result.status = ProofStatus::Unknown;
      result.reason = s.reason_unknown();
    } else if ((r == z3::unsat) != direct) {
      result.status = ProofStatus::Proved;
    } else {
      result.status = ProofStatus::Refuted;
      if (r == z3::sat) {
        const z3::model m = s.get_model();
        for (const ValueExpr * v : universals) {
          result.counterexample.emplace_back(v, z.value_of(m, vars.at(v)));
        }
      }
    }
  } catch (const z3::exception & e) {
    result.status = ProofStatus::Unknown;
    result.reason = e.msg();
  }
  return result;
}

ProofResult SolverSession::prove_unique(const SolverQuery & query, const ValueExpr * var)
{
  ProofResult result;
  try {
    Impl & z = *impl_;
    VarMap vars;
    VarMap primed;
    const std::vector<const ValueExpr *> all = vars_of(query);
    std::vector<const ValueExpr *> universals;
    for (const ValueExpr * v : all) {
      const bool unknown =
        std::find(query.unknowns.begin(), query.unknowns.end(), v) != query.unknowns.end();
      const z3::expr c = z.declare(vars, v);
      if (unknown) {
        z.declare(primed, v, "'");
      } else {
        universals.push_back(v);
        primed.emplace(v, c);
      }
    }

    z3::solver s = z.make_solver(options_);
    s.add(z.naturals(vars, all));
    s.add(z.naturals(primed, query.unknowns));
    s.add(z.conjunction(query.assumptions, vars));
    s.add(z.conjunction(query.assumptions, primed));
    s.add(z.conjunction(query.implications, vars));
    s.add(z.conjunction(query.implications, primed));
    s.add(z.conjunction(query.constraints, vars));
    s.add(z.conjunction(query.constraints, primed));
    s.add(vars.at(var) != primed.at(var));

    dump_query(options_.dump_queries, query.description, s);
    ++query_count_;
    ++total_queries_;

    switch (s.check()) {
      case z3::unsat:
        result.status = ProofStatus::Proved;
        break;
      case z3::sat: {
        result.status = ProofStatus::Refuted;
        const z3::model m = s.get_model();
        result.first = z.value_of(m, vars.at(var));
        result.second = z.value_of(m, primed.at(var));
        for (const ValueExpr * v : universals) {
          result.counterexample.emplace_back(v, z.value_of(m, vars.at(v)));
        }
        break;
      }
      case z3::unknown:
        result.status = ProofStatus::Unknown;
        result.reason = s.reason_unknown();
        break;
    }
  } catch (const z3::exception & e) {
    result.status = ProofStatus::Unknown;
    result.reason = e.msg();
  }
  return result;
}

SolverResponse SolverSession::solve(const SolverQuery & query)
{
  SolverResponse response;
  try {
    Impl & z = *impl_;
    VarMap vars;
    const std::vector<const ValueExpr *> all = vars_of(query);
    for (const ValueExpr * v : all) {
      z.declare(vars, v);
    }

    z3::solver s = z.make_solver(options_);
    s.add(z.naturals(vars, all));
    s.add(z.conjunction(query.assumptions, vars));
    s.add(z.conjunction(query.implications, vars));
    for (size_t i = 0; i < query.constraints.size(); ++i) {
      const std::string tag = "c" + std::to_string(i);
      s.add(z.translate(query.constraints[i], vars), tag.c_str());
    }

    dump_query(options_.dump_queries, query.description, s);
    ++query_count_;
    ++total_queries_;

    const z3::check_result first = s.check();
    if (first == z3::unknown) {
      response.status = SolverStatus::Unknown;
      response.reason = s.reason_unknown();
      return response;
    }
    if (first == z3::unsat) {
      response.status = SolverStatus::Unsat;
      const z3::expr_vector core = s.unsat_core();
      for (unsigned i = 0; i < core.size(); ++i) {
        const std::string name = core[i].decl().name().str();
        if (name.size() > 1 && name[0] == 'c') {
          response.unsat_core.push_back(std::stoul(name.substr(1)));
        }
      }
      std::sort(response.unsat_core.begin(), response.unsat_core.end());
      return response;
    }

    const z3::model m = s.get_model();
    z3::expr_vector differs(z.ctx);
    for (const ValueExpr * u : query.unknowns) {
      const int64_t v = z.value_of(m, vars.at(u));
      response.assignment.emplace_back(u, v);
      differs.push_back(vars.at(u) != z.ctx.int_val(static_cast<int64_t>(v)));
    }
    if (differs.empty()) {
      response.status = SolverStatus::Sat;
      return response;
    }

    // Block the model: any second solution makes the result ambiguous.
    s.add(z3::mk_or(differs));
    ++query_count_;
    ++total_queries_;
    switch (s.check()) {
      case z3::unsat:
        response.status = SolverStatus::Sat;
        break;
      case z3::sat: {
        response.status = SolverStatus::Ambiguous;
        const z3::model other = s.get_model();
        for (const auto & [u, v] : response.assignment) {
          const int64_t w = z.value_of(other, vars.at(u));
          if (w != v) {
            response.ambiguous = u;
            response.first = v;
            response.second = w;
            break;
          }
        }
        break;
      }
      case z3::unknown:
        response.status = SolverStatus::Unknown;
        response.reason = s.reason_unknown();
        break;
    }
  } catch (const z3::exception & e) {
    response.status = SolverStatus::Unknown;
    response.reason = e.msg();
  }
  return response;
}

}  // namespace filament
