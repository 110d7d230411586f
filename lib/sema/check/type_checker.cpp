// filament/sema/check/type_checker.cpp - Temporal type checker
#include "filament/sema/check/type_checker.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <unordered_map>

namespace filament
{

namespace
{

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

std::string render_window(const Interval & w)
{
  return "[" + render(w.start) + ", " + render(w.end) + ")";
}

std::string render_args(const std::vector<const ValueExpr *> & args)
{
  std::string out = "[";
  for (size_t i = 0; i < args.size(); ++i) {
    if (i != 0) out += ", ";
    out += render(args[i]);
  }
  return out + "]";
}

bool params_only(const ValueExpr * e)
{
  return !any_var(e, [](const ValueExpr * v) { return v->var_kind != VarKind::Param; });
}

const CheckedPort * find_port(const std::vector<CheckedPort> & ports, std::string_view name)
{
  auto it =
    std::find_if(ports.begin(), ports.end(), [&](const CheckedPort & p) { return p.name == name; });
  return it != ports.end() ? &*it : nullptr;
}

}  // namespace

// ============================================================================
// CheckedComponent
// ============================================================================

const CheckedInvocation * CheckedComponent::find_invocation(std::string_view name) const
{
  auto it = std::find_if(invocations.begin(), invocations.end(), [&](const auto & inv) {
    return inv.name == name;
  });
  return it != invocations.end() ? &*it : nullptr;
}

bool CheckedComponent::mentions_free_existential(const Constraint & c) const
{
  auto is_free = [this](const ValueExpr * v) {
    return std::find(free_existentials.begin(), free_existentials.end(), v) !=
           free_existentials.end();
  };
  return std::any_of(c.terms.begin(), c.terms.end(), [&](const Comparison & cmp) {
    return any_var(cmp.lhs, is_free) || any_var(cmp.rhs, is_free);
  });
}

// ============================================================================
// Entry Point
// ============================================================================

CheckedComponent TypeChecker::check(const ComponentDef & def)
{
  has_errors_ = false;
  error_count_ = 0;
  result_ = CheckedComponent{};
  result_.def = &def;
  instances_.clear();

  bind_instances(def);
  flatten_existentials(def);
  check_signature(def);
  check_instance_guards();
  place_invocations(def);
  check_invocation_args(def);
  check_bindings(def);
  check_reuse(def);
  collect_existential_guards(def);
  compute_exports(def);

  result_.has_errors = has_errors_;
  return std::move(result_);
}

std::vector<const ValueExpr *> TypeChecker::signature_exports(
  const ComponentDef & def, ExprPool & pool)
{
  Substitution defs;
  for (const auto & e : def.existentials) {
    if (e.definition != nullptr) {
      defs.emplace(e.var, e.definition);
    }
  }

  std::vector<const ValueExpr *> out;
  out.reserve(def.existentials.size());
  for (const auto & e : def.existentials) {
    const ValueExpr * value = e.definition;
    // Chains of definitions are at most as long as the number of existentials.
    for (size_t i = 0; value != nullptr && i < def.existentials.size(); ++i) {
      value = pool.substitute(value, defs);
    }
    out.push_back(value != nullptr && params_only(value) ? value : nullptr);
  }
  return out;
}

// ============================================================================
// Instances and existentials
// ============================================================================

void TypeChecker::bind_instances(const ComponentDef & def)
{
  for (const auto & inst : def.instances) {
    InstanceInfo info;
    info.inst = &inst;
    info.callee = inst.component;
    if (info.callee == nullptr) {
      instances_.push_back(std::move(info));
      continue;
    }

    const ComponentDef & callee = *info.callee;
    if (inst.args.size() != callee.params.size()) {
      report_error(
        ErrorKind::ArgumentCount, inst.range,
        "component " + quote_name(callee.name) + " expects " + std::to_string(callee.params.size()) +
          " parameter(s), got " + std::to_string(inst.args.size()),
        "instantiated here");
      instances_.push_back(std::move(info));
      continue;
    }
    info.arity_ok = true;

    for (size_t i = 0; i < callee.params.size(); ++i) {
      info.subst.emplace(pool_.param(callee.params[i]), inst.args[i]);
    }

    const CheckedComponent * checked = lookup_ ? lookup_(&callee) : nullptr;
    const std::vector<const ValueExpr *> exports =
      checked != nullptr ? checked->exported : signature_exports(callee, pool_);

    // Parameters only, so exported values are substituted before the
    // existentials are added to the map.
    std::vector<std::pair<const ValueExpr *, const ValueExpr *>> exist_entries;
    for (size_t j = 0; j < callee.existentials.size(); ++j) {
      const auto & e = callee.existentials[j];
      const ValueExpr * inst_var = pool_.instance_exist(inst.name, e.name);
      const ValueExpr * value = j < exports.size() ? exports[j] : nullptr;
      if (value != nullptr) {
        value = pool_.substitute(value, info.subst);
        result_.flattening.emplace(inst_var, value);
        exist_entries.emplace_back(e.var, value);
      } else {
        exist_entries.emplace_back(e.var, inst_var);
      }
    }
    for (const auto & [var, value] : exist_entries) {
      info.subst.emplace(var, value);
    }

    instances_.push_back(std::move(info));
  }
}

void TypeChecker::flatten_existentials(const ComponentDef & def)
{
  enum class State : uint8_t { Pending, Active, Done };
  std::unordered_map<const ValueExpr *, State> state;
  std::unordered_map<const ValueExpr *, const ExistentialDef *> by_var;
  for (const auto & e : def.existentials) {
    by_var.emplace(e.var, &e);
    state.emplace(e.var, State::Pending);
  }

  std::vector<std::string_view> chain;
  std::function<void(const ExistentialDef &)> resolve;
  resolve = [&](const ExistentialDef & e) {
    state[e.var] = State::Active;
    chain.push_back(e.name);

    std::vector<const ValueExpr *> deps;
    collect_vars(e.definition, deps);
    bool cyclic = false;
    for (const ValueExpr * dep : deps) {
      auto it = by_var.find(dep);
      if (it == by_var.end() || it->second->definition == nullptr) continue;
      if (state[dep] == State::Active) {
        std::string path;
        auto from = std::find(chain.begin(), chain.end(), it->second->name);
        for (; from != chain.end(); ++from) {
          path += std::string(*from) + " -> ";
        }
        path += std::string(it->second->name);
        report_error(
          ErrorKind::UnsatisfiableConstraints, e.definition_range,
          "existential definitions of " + quote_name(def.name) + " are cyclic: " + path,
          "defined in terms of itself");
        cyclic = true;
        continue;
      }
      if (state[dep] == State::Pending) {
        resolve(*it->second);
      }
    }

    if (!cyclic) {
      result_.flattening[e.var] = pool_.substitute(e.definition, result_.flattening);
    }
    chain.pop_back();
    state[e.var] = State::Done;
  };

  for (const auto & e : def.existentials) {
    if (e.definition == nullptr) {
      result_.free_existentials.push_back(e.var);
    } else if (state[e.var] == State::Pending) {
      resolve(e);
    }
  }
}

// ============================================================================
// Signature
// ============================================================================

void TypeChecker::check_signature(const ComponentDef & def)
{
  result_.delay = flat(def.delay);
  {
    Constraint c;
    c.terms.push_back(Comparison{CmpOp::Ge, result_.delay, pool_.constant(1)});
    c.origin = ConstraintOrigin::WellFormed;
    c.kind = ErrorKind::MalformedInterval;
    c.range = def.delay_range.is_valid() ? def.delay_range : def.range;
    c.message = "delay of component " + quote_name(def.name) + " must be at least one cycle";
    c.label = "delay is " + render(result_.delay);
    obligate(std::move(c));
  }

  auto check_port = [&](const PortDef & port) {
    CheckedPort out{port.name, flat(port.interval), port.width ? flat(port.width) : nullptr};

    Constraint c;
    c.origin = ConstraintOrigin::WellFormed;
    c.kind = ErrorKind::MalformedInterval;
    c.range = port.range;
    if (port.is_interface) {
      c.terms.push_back(Comparison{CmpOp::Eq, out.interval.start.offset, pool_.constant(0)});
      c.message = "interface port " + quote_name(port.name) + " must be active in the first cycle of " +
                  quote_name(def.event);
      c.label = "starts at " + render(out.interval.start);
      c.notes.push_back("expected: interface[" + std::string(def.event) + "]");
    } else {
      c.terms.push_back(Comparison{CmpOp::Lt, out.interval.start.offset, out.interval.end.offset});
      c.message = "interval " + render(out.interval) + " of port " + quote_name(port.name) +
                  " is empty";
      c.label = "start must precede end";
    }
    obligate(std::move(c));
    return out;
  };

  for (const auto & port : def.inputs) {
    result_.inputs.push_back(check_port(port));
  }
  for (const auto & port : def.outputs) {
    result_.outputs.push_back(check_port(port));
  }

  for (const auto & g : def.guards) {
    const Comparison cmp = substitute(pool_, g.cmp, result_.flattening);
    result_.assumptions.push_back(Assumption{cmp, "where " + render(g.cmp), {}});
  }
}

void TypeChecker::check_instance_guards()
{
  for (const auto & info : instances_) {
    if (!info.arity_ok) continue;
    const ComponentDef & callee = *info.callee;

    for (const auto & g : callee.guards) {
      Constraint c;
      c.terms.push_back(substitute(pool_, g.cmp, info.subst));
      c.origin = ConstraintOrigin::CalleeGuard;
      c.kind = ErrorKind::GuardViolated;
      c.range = info.inst->range;
      c.message = "instance " + quote_name(info.inst->name) + " violates guard " +
                  quote_name(render(g.cmp)) + " of component " + quote_name(callee.name);
      c.label = "instantiated with " + render_args(info.inst->args);
      c.notes.push_back("requires: " + render(c.terms.front()));
      c.related_range = g.range;
      c.related_label = "guard declared here";
      obligate(std::move(c));
    }

    assume_callee_facts(info);
  }
}

void TypeChecker::assume_callee_facts(const InstanceInfo & info)
{
  const ComponentDef & callee = *info.callee;
  const std::string of = " (" + std::string(info.inst->name) + ")";

  // The callee proved these under its own guards.
  std::vector<Comparison> premises;
  for (const auto & g : callee.guards) {
    const Comparison cmp = substitute(pool_, g.cmp, info.subst);
    const std::optional<bool> r = decide(pool_, cmp);
    if (r == std::optional<bool>(false)) return;
    if (!r) premises.push_back(cmp);
  }

  auto assume = [&](const Comparison & cmp, std::string source) {
    if (decide(pool_, cmp) == std::optional<bool>(true)) return;
    result_.assumptions.push_back(Assumption{cmp, std::move(source), premises});
  };

  assume(
    Comparison{CmpOp::Ge, pool_.substitute(callee.delay, info.subst), pool_.constant(1)},
    "delay of " + std::string(callee.name) + of);

  auto port_facts = [&](const std::vector<PortDef> & ports) {
    for (const auto & p : ports) {
      if (p.is_interface) continue;
      assume(
        Comparison{
          CmpOp::Lt, pool_.substitute(p.interval.start.offset, info.subst),
          pool_.substitute(p.interval.end.offset, info.subst)},
        "port " + std::string(p.name) + " of " + std::string(callee.name) + of);
    }
  };
  port_facts(callee.inputs);
  port_facts(callee.outputs);

  for (const auto & e : callee.existentials) {
    for (const auto & g : e.guards) {
      assume(
        substitute(pool_, g.cmp, info.subst),
        "where " + render(g.cmp) + " (existential of " + std::string(info.inst->name) + ")");
    }
  }
}

// ============================================================================
// Body
// ============================================================================

void TypeChecker::place_invocations(const ComponentDef & def)
{
  for (const auto & inv : def.invocations) {
    auto it = std::find_if(instances_.begin(), instances_.end(), [&](const InstanceInfo & i) {
      return i.inst->name == inv.instance;
    });
    if (it == instances_.end() || !it->arity_ok) continue;

    const ComponentDef & callee = *it->callee;
    CheckedInvocation ci;
    ci.name = inv.name;
    ci.instance = inv.instance;
    ci.callee = &callee;
    ci.time = flat(inv.time);
    ci.window =
      Interval{ci.time, shift(pool_, ci.time, pool_.substitute(callee.delay, it->subst))};

    for (const auto & p : callee.inputs) {
      if (p.is_interface) continue;
      ci.inputs.push_back(CheckedPort{
        p.name,
        Interval{
          rebase(pool_, p.interval.start, ci.time, it->subst),
          rebase(pool_, p.interval.end, ci.time, it->subst)},
        pool_.substitute(p.width, it->subst)});
    }
    for (const auto & p : callee.outputs) {
      ci.outputs.push_back(CheckedPort{
        p.name,
        Interval{
          rebase(pool_, p.interval.start, ci.time, it->subst),
          rebase(pool_, p.interval.end, ci.time, it->subst)},
        p.width ? pool_.substitute(p.width, it->subst) : nullptr});
    }
    result_.invocations.push_back(std::move(ci));
  }
}

void TypeChecker::check_invocation_args(const ComponentDef & def)
{
  for (const auto & inv : def.invocations) {
    const CheckedInvocation * ci = result_.find_invocation(inv.name);
    if (ci == nullptr) continue;

    if (inv.args.size() != ci->inputs.size()) {
      report_error(
        ErrorKind::ArgumentCount, inv.range,
        "invocation " + quote_name(inv.name) + " passes " + std::to_string(inv.args.size()) +
          " argument(s) but " + quote_name(ci->callee->name) + " has " +
          std::to_string(ci->inputs.size()) + " data input(s)",
        "invoked here");
      continue;
    }

    for (size_t i = 0; i < inv.args.size(); ++i) {
      CheckedPort supplied;
      if (!source_port(inv.args[i], supplied)) continue;
      require_match(
        ci->inputs[i], supplied, inv.args[i].range,
        "argument " + quote_name(ci->inputs[i].name) + " of invocation " + quote_name(inv.name));
    }
  }
}

void TypeChecker::check_bindings(const ComponentDef & def)
{
  if (def.is_extern) return;

  for (size_t i = 0; i < def.outputs.size(); ++i) {
    const PortDef & out = def.outputs[i];
    std::vector<const BindingDef *> bound;
    for (const auto & b : def.bindings) {
      if (b.output == out.name) bound.push_back(&b);
    }

    if (bound.empty()) {
      report_error(
        ErrorKind::UnboundOutput, out.range,
        "output " + quote_name(out.name) + " of component " + quote_name(def.name) + " is never bound",
        "declared here");
      continue;
    }
    for (size_t k = 1; k < bound.size(); ++k) {
      report_error(
        ErrorKind::DuplicateDefinition, bound[k]->range,
        "output " + quote_name(out.name) + " is bound more than once", "bound again here");
    }

    CheckedPort supplied;
    if (!source_port(bound.front()->src, supplied)) continue;
    require_match(result_.outputs[i], supplied, bound.front()->range, "output " + quote_name(out.name));
  }
}

void TypeChecker::check_reuse(const ComponentDef & def)
{
  const auto & invs = result_.invocations;
  for (size_t i = 0; i < invs.size(); ++i) {
    for (size_t j = i + 1; j < invs.size(); ++j) {
      const CheckedInvocation & a = invs[i];
      const CheckedInvocation & b = invs[j];
      if (a.instance != b.instance) continue;

      Constraint c;
      c.disjunctive = true;
      c.terms.push_back(Comparison{CmpOp::Le, a.window.end.offset, b.window.start.offset});
      c.terms.push_back(Comparison{CmpOp::Le, b.window.end.offset, a.window.start.offset});
      c.origin = ConstraintOrigin::Reuse;
      c.kind = ErrorKind::ReuseHazard;
      c.range = def.find_invocation(b.name)->range;
      c.message = "invocations " + quote_name(a.name) + " and " + quote_name(b.name) + " of instance " +
                  quote_name(a.instance) + " overlap";
      c.label = "active during " + render_window(b.window);
      c.notes.push_back(quote_name(a.name) + " is active during " + render_window(a.window));
      c.notes.push_back(quote_name(b.name) + " is active during " + render_window(b.window));
      c.related_range = def.find_invocation(a.name)->range;
      c.related_label = "first use here";
      obligate(std::move(c));
    }
  }
}

void TypeChecker::collect_existential_guards(const ComponentDef & def)
{
  for (const auto & e : def.existentials) {
    for (const auto & g : e.guards) {
      Constraint c;
      c.terms.push_back(substitute(pool_, g.cmp, result_.flattening));
      c.origin = ConstraintOrigin::ExistentialGuard;
      c.kind = ErrorKind::UnsatisfiableConstraints;
      c.range = g.range;
      c.message = "guard " + quote_name(render(g.cmp)) + " of existential " + quote_name(e.name) +
                  " cannot be satisfied";
      c.label = "required here";
      if (e.definition != nullptr) {
        c.notes.push_back(std::string(e.name) + " = " + render(result_.flattening[e.var]));
      }
      obligate(std::move(c));
    }
  }
}

void TypeChecker::compute_exports(const ComponentDef & def)
{
  result_.exported.reserve(def.existentials.size());
  for (const auto & e : def.existentials) {
    auto it = result_.flattening.find(e.var);
    const ValueExpr * value = it != result_.flattening.end() ? it->second : nullptr;
    result_.exported.push_back(value != nullptr && params_only(value) ? value : nullptr);
  }
}

// ============================================================================
// Helpers
// ============================================================================

const ValueExpr * TypeChecker::flat(const ValueExpr * e)
{
  return pool_.substitute(e, result_.flattening);
}

TimeExpr TypeChecker::flat(const TimeExpr & t) { return TimeExpr{t.event, flat(t.offset)}; }

Interval TypeChecker::flat(const Interval & i) { return Interval{flat(i.start), flat(i.end)}; }

bool TypeChecker::source_port(const PortSource & src, CheckedPort & out) const
{
  switch (src.kind) {
    case PortSource::Kind::Constant:
      return false;
    case PortSource::Kind::Own: {
      const CheckedPort * p = find_port(result_.inputs, src.port);
      if (p == nullptr) return false;
      out = *p;
      return true;
    }
    case PortSource::Kind::Invocation: {
      const CheckedInvocation * ci = result_.find_invocation(src.invocation);
      if (ci == nullptr) return false;
      const CheckedPort * p = find_port(ci->outputs, src.port);
      if (p == nullptr) return false;
      out = *p;
      return true;
    }
  }
  return false;
}

void TypeChecker::require_match(
  const CheckedPort & required, const CheckedPort & supplied, SourceRange range,
  const std::string & what)
{
  {
    Constraint c;
    c.terms.push_back(
      Comparison{CmpOp::Eq, required.interval.start.offset, supplied.interval.start.offset});
    c.terms.push_back(
      Comparison{CmpOp::Eq, required.interval.end.offset, supplied.interval.end.offset});
    c.origin = ConstraintOrigin::PortInterval;
    c.kind = ErrorKind::IntervalMismatch;
    c.range = range;
    c.message = "interval mismatch for " + what;
    c.label = "available in " + render(supplied.interval);
    c.notes.push_back("required: " + render(required.interval));
    c.notes.push_back("supplied: " + render(supplied.interval));
    obligate(std::move(c));
  }

  if (required.width != nullptr && supplied.width != nullptr) {
    Constraint c;
    c.terms.push_back(Comparison{CmpOp::Eq, required.width, supplied.width});
    c.origin = ConstraintOrigin::PortWidth;
    c.kind = ErrorKind::BitwidthMismatch;
    c.range = range;
    c.message = "bit-width mismatch for " + what;
    c.label = "has width " + render(supplied.width);
    c.notes.push_back("required: " + render(required.width));
    c.notes.push_back("supplied: " + render(supplied.width));
    obligate(std::move(c));
  }
}

void TypeChecker::obligate(Constraint c)
{
  std::vector<Comparison> undecided;
  bool any_true = false;
  bool any_false = false;
  for (const auto & term : c.terms) {
    const auto r = decide(pool_, term);
    if (!r) {
      undecided.push_back(term);
    } else if (*r) {
      any_true = true;
    } else {
      any_false = true;
    }
  }

  const bool failed = c.disjunctive ? (!any_true && undecided.empty()) : any_false;
  const bool holds = c.disjunctive ? any_true : (!any_false && undecided.empty());

  if (failed) {
    has_errors_ = true;
    error_count_++;
    if (diags_ != nullptr) {
      auto builder = diags_->report(c.kind, c.range, c.message, c.label);
      for (auto & note : c.notes) {
        builder.with_note(std::move(note));
      }
      if (c.related_range.is_valid()) {
        builder.with_secondary_label(c.related_range, c.related_label);
      }
    }
    return;
  }
  if (holds) return;

  c.terms = std::move(undecided);
  result_.obligations.push_back(std::move(c));
}

void TypeChecker::report_error(
  ErrorKind kind, SourceRange range, std::string message, std::string label,
  std::vector<std::string> notes)
{
  has_errors_ = true;
  error_count_++;
  if (diags_ != nullptr) {
    auto builder = diags_->report(kind, range, std::move(message), std::move(label));
    for (auto & note : notes) {
      builder.with_note(std::move(note));
    }
  }
}

}  // namespace filament
