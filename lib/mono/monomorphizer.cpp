// filament/mono/monomorphizer.cpp - Specialization of checked components
#include "filament/mono/monomorphizer.hpp"

#include <algorithm>
#include <future>
#include <utility>

namespace filament
{

namespace
{

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

}  // namespace

// ============================================================================
// Entry
// ============================================================================

std::optional<MonoProgram> Monomorphizer::run(
  const ComponentDef & entry, const std::vector<int64_t> & args)
{
  error_count_ = 0;
  solver_queries_ = 0;

  if (!check_entry(entry, args)) {
    return std::nullopt;
  }

  const SpecKey key{&entry, args};
  DiagnosticBag graph_diags;
  graph_ = std::make_unique<InstantiationGraph>(pool_, &graph_diags, options_.max_depth);
  const bool graph_ok = graph_->build(key);
  if (diags_ != nullptr) {
    diags_->merge(std::move(graph_diags));
  }
  if (!graph_ok) {
    error_count_ += graph_->error_count();
    return std::nullopt;
  }
  trace(
    "[mono] " + key.render() + ": " + std::to_string(graph_->nodes().size()) +
    " specialization(s)");

  Result root = produce(graph_->entry());
  if (!root || has_errors()) {
    return std::nullopt;
  }

  // Every key is cached at this point; these lookups never produce.
  MonoProgram program;
  program.components.reserve(graph_->post_order().size());
  for (const size_t idx : graph_->post_order()) {
    Result r = produce(idx);
    if (!r) {
      return std::nullopt;
    }
    program.components.push_back(std::move(r));
  }
  program.entry = root.get();
  return program;
}

bool Monomorphizer::check_entry(const ComponentDef & entry, const std::vector<int64_t> & args)
{
  if (args.size() != entry.params.size()) {
    std::vector<std::string> notes;
    if (!entry.params.empty()) {
      std::string names;
      for (const auto p : entry.params) {
        if (!names.empty()) names += ", ";
        names += std::string(p);
      }
      notes.push_back("parameters: " + names);
    }
    report_error(
      ErrorKind::ArgumentCount, entry.range,
      "entry component " + quote_name(entry.name) + " expects " +
        std::to_string(entry.params.size()) + " parameter(s), got " + std::to_string(args.size()),
      "defined here", std::move(notes));
    return false;
  }

  Substitution ground;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] < 0) {
      report_error(
        ErrorKind::GuardViolated, entry.range,
        "parameter " + quote_name(entry.params[i]) + " of " + quote_name(entry.name) +
          " must be a natural number",
        "defined here", {std::string(entry.params[i]) + " = " + std::to_string(args[i])});
      return false;
    }
    ground.emplace(pool_.param(entry.params[i]), pool_.constant(args[i]));
  }

  const std::string key = SpecKey{&entry, args}.render();
  bool ok = true;
  for (const auto & g : entry.guards) {
    const Comparison cmp = substitute(pool_, g.cmp, ground);
    if (decide(pool_, cmp) != std::optional<bool>(true)) {
      report_error(
        ErrorKind::GuardViolated, g.range,
        key + " violates guard " + quote_name(render(g.cmp)), "guard declared here",
        {"evaluates to " + render(cmp)});
      ok = false;
    }
  }
  return ok;
}

// ============================================================================
// Specialization
// ============================================================================

Monomorphizer::Result Monomorphizer::produce(size_t node)
{
  const InstantiationGraph::Node & n = graph_->nodes()[node];
  return cache_.insert_if_absent(n.key, [&]() -> Result {
    std::vector<Result> children(n.children.size());

    // Children 1..parallel run on their own threads, the rest on this one.
    const size_t parallel = options_.jobs > 1 && n.children.size() > 1
                              ? std::min(options_.jobs - 1, n.children.size() - 1)
                              : 0;
    std::vector<std::future<Result>> pending;
    pending.reserve(parallel);
    for (size_t i = 1; i <= parallel; ++i) {
      const size_t target = n.children[i].target;
      pending.push_back(std::async(std::launch::async, [this, target]() { return produce(target); }));
    }
    for (size_t i = 0; i < n.children.size(); ++i) {
      if (i >= 1 && i <= parallel) continue;
      children[i] = produce(n.children[i].target);
    }
    for (size_t i = 1; i <= parallel; ++i) {
      children[i] = pending[i - 1].get();
    }

    if (std::any_of(children.begin(), children.end(), [](const Result & r) { return !r; })) {
      return nullptr;
    }
    return specialize(n, children);
  });
}

Monomorphizer::Result Monomorphizer::specialize(
  const InstantiationGraph::Node & node, const std::vector<Result> & children)
{
  const SpecKey & key = node.key;
  const ComponentDef & def = *key.def;
  const std::string title = key.render();

  const CheckedComponent * checked = lookup_ ? lookup_(&def) : nullptr;
  if (checked == nullptr || checked->has_errors) {
    report_error(
      ErrorKind::UnsatisfiableConstraints, def.range,
      "cannot specialize " + quote_name(def.name) + ": the component did not check");
    return nullptr;
  }

  auto mono = std::make_shared<MonoComponent>();
  mono->key = key;
  mono->name = key.mangle();
  mono->definition = std::string(def.name);
  mono->event = std::string(def.event);
  mono->is_extern = def.is_extern;

  Environment env;
  Substitution ground;
  auto bind = [&](const ValueExpr * var, int64_t value) {
    env[var] = value;
    ground[var] = pool_.constant(value);
  };

  for (size_t i = 0; i < def.params.size(); ++i) {
    bind(pool_.param(def.params[i]), key.args[i]);
    mono->params.emplace_back(std::string(def.params[i]), key.args[i]);
  }

  for (size_t i = 0; i < node.children.size(); ++i) {
    const MonoComponent & child = *children[i];
    for (const auto & [name, value] : child.existentials) {
      bind(pool_.instance_exist(node.children[i].instance, name), value);
    }
    mono->instances.push_back(MonoInstance{std::string(node.children[i].instance), &child});
  }

  if (!checked->free_existentials.empty() && !solve_free(key, *checked, env, ground)) {
    return nullptr;
  }

  for (const auto & e : def.existentials) {
    if (e.definition == nullptr) continue;
    auto it = checked->flattening.find(e.var);
    const std::optional<int64_t> v =
      it != checked->flattening.end() ? evaluate(it->second, env) : std::nullopt;
    if (!v || *v < 0) {
      report_error(
        ErrorKind::UnsatisfiableConstraints, e.definition_range,
        "existential " + quote_name(e.name) + " of " + title + " has no natural value",
        "defined here",
        {it != checked->flattening.end() ? std::string(e.name) + " = " + render(it->second)
                                          : std::string(e.name) + " is undefined"});
      return nullptr;
    }
    bind(e.var, *v);
  }
  for (const auto & e : def.existentials) {
    mono->existentials.emplace_back(std::string(e.name), env.at(e.var));
  }

  bool guards_ok = true;
  for (const auto & e : def.existentials) {
    for (const auto & g : e.guards) {
      const std::optional<int64_t> l = evaluate(g.cmp.lhs, env);
      const std::optional<int64_t> r = evaluate(g.cmp.rhs, env);
      if (l && r && holds(g.cmp.op, *l, *r)) continue;
      report_error(
        ErrorKind::GuardViolated, g.range,
        title + " violates guard " + quote_name(render(g.cmp)) + " of existential " +
          quote_name(e.name),
        "guard declared here",
        {std::string(e.name) + " = " + std::to_string(env.at(e.var))});
      guards_ok = false;
    }
  }
  if (!guards_ok) {
    return nullptr;
  }

  // Everything below is ground now.
  bool ok = true;
  auto value_of = [&](const ValueExpr * expr, SourceRange range, const std::string & what) {
    const std::optional<int64_t> v = evaluate(expr, env);
    if (!v || *v < 0) {
      report_error(
        ErrorKind::MalformedInterval, range, what + " of " + title + " is not a natural number",
        "", {render(expr) + " = " + (v ? std::to_string(*v) : std::string("undefined"))});
      ok = false;
      return int64_t{0};
    }
    return *v;
  };

  mono->delay = value_of(checked->delay, def.delay_range, "delay");

  auto lower_ports = [&](
                       const std::vector<PortDef> & defs, const std::vector<CheckedPort> & ports,
                       std::vector<MonoPort> & out) {
    for (size_t i = 0; i < defs.size() && i < ports.size(); ++i) {
      const PortDef & p = defs[i];
      MonoPort mp;
      mp.name = std::string(p.name);
      mp.direction = p.direction;
      mp.is_interface = p.is_interface;
      mp.start = value_of(ports[i].interval.start.offset, p.range, "start of " + quote_name(p.name));
      mp.end = value_of(ports[i].interval.end.offset, p.range, "end of " + quote_name(p.name));
      if (ports[i].width != nullptr) {
        mp.width = value_of(ports[i].width, p.range, "width of " + quote_name(p.name));
      }
      out.push_back(std::move(mp));
    }
  };
  lower_ports(def.inputs, checked->inputs, mono->inputs);
  lower_ports(def.outputs, checked->outputs, mono->outputs);

  auto lower_source = [](const PortSource & src) {
    MonoSource ms;
    ms.kind = src.kind;
    ms.invocation = std::string(src.invocation);
    ms.port = std::string(src.port);
    ms.constant = src.constant;
    return ms;
  };

  for (const auto & inv : def.invocations) {
    const CheckedInvocation * ci = checked->find_invocation(inv.name);
    MonoInvocation mi;
    mi.name = std::string(inv.name);
    mi.instance = std::string(inv.instance);
    mi.start = value_of(
      ci != nullptr ? ci->time.offset : inv.time.offset, inv.range,
      "start time of " + quote_name(inv.name));
    for (const auto & arg : inv.args) {
      mi.args.push_back(lower_source(arg));
    }
    mono->invocations.push_back(std::move(mi));
  }

  for (const auto & b : def.bindings) {
    mono->bindings.push_back(MonoBinding{std::string(b.output), lower_source(b.src)});
  }

  if (!ok) {
    return nullptr;
  }

  if (log_ != nullptr) {
    std::string values;
    for (const auto & [name, value] : mono->existentials) {
      values += " " + name + "=" + std::to_string(value);
    }
    trace("[mono] " + title + " -> " + mono->name + " (delay " + std::to_string(mono->delay) +
          (values.empty() ? "" : ";" + values) + ")");
  }
  return mono;
}

bool Monomorphizer::solve_free(
  const SpecKey & key, const CheckedComponent & checked, Environment & env,
  Substitution & ground)
{
  const ComponentDef & def = *key.def;
  const std::string title = key.render();

  SolverQuery q;
  q.unknowns = checked.free_existentials;
  for (const auto & a : checked.assumptions) {
    const Comparison cmp = substitute(pool_, a.cmp, ground);
    if (a.premises.empty()) {
      q.assumptions.push_back(cmp);
      continue;
    }
    Implication imp{{}, cmp};
    for (const auto & p : a.premises) {
      imp.premises.push_back(substitute(pool_, p, ground));
    }
    q.implications.push_back(std::move(imp));
  }
  for (const auto & c : checked.obligations) {
    if (!checked.mentions_free_existential(c)) continue;
    Constraint g = c;
    for (auto & t : g.terms) {
      t = substitute(pool_, t, ground);
    }
    q.constraints.push_back(std::move(g));
  }
  q.description = title + ": existential values";

  // Sessions are not shareable between threads; each key gets its own.
  SolverSession session(options_.solver);
  const SolverResponse r = session.solve(q);
  solver_queries_ += session.query_count();

  auto decl_range = [&](const ValueExpr * var) {
    auto it = std::find_if(def.existentials.begin(), def.existentials.end(), [&](const auto & e) {
      return e.var == var;
    });
    return it != def.existentials.end() ? it->range : def.range;
  };

  switch (r.status) {
    case SolverStatus::Sat:
      for (const auto & [var, value] : r.assignment) {
        env[var] = value;
        ground[var] = pool_.constant(value);
      }
      return true;

    case SolverStatus::Unsat: {
      std::string names;
      for (const ValueExpr * e : checked.free_existentials) {
        if (!names.empty()) names += ", ";
        names += render(e);
      }
      std::vector<std::string> notes;
      SourceRange range = def.range;
      for (const size_t idx : r.unsat_core) {
        if (idx >= q.constraints.size()) continue;
        const Constraint & c = q.constraints[idx];
        if (notes.empty()) range = c.range;
        notes.push_back(
          "conflicting clause (" + std::string(to_string(c.origin)) + "): " + c.message + ": " +
          c.render());
      }
      report_error(
        ErrorKind::UnsatisfiableConstraints, range,
        "no value of " + names + " satisfies the constraints of " + title, "", std::move(notes));
      return false;
    }

    case SolverStatus::Ambiguous: {
      const std::string name = r.ambiguous != nullptr ? render(r.ambiguous) : "?";
      std::vector<std::string> notes;
      notes.push_back(
        "both " + name + " = " + std::to_string(r.first) + " and " + name + " = " +
        std::to_string(r.second) + " satisfy every constraint");
      report_error(
        ErrorKind::UnderconstrainedExistential, decl_range(r.ambiguous),
        "existential " + quote_name(name) + " of " + title + " is not uniquely determined",
        "declared here", std::move(notes));
      return false;
    }

    case SolverStatus::Unknown:
      report_error(
        ErrorKind::SolverUnknown, def.range,
        "solver could not determine the existentials of " + title, "",
        {"reason: " + (r.reason.empty() ? std::string("unknown") : r.reason)});
      return false;
  }
  return false;
}

// ============================================================================
// Reporting
// ============================================================================

void Monomorphizer::report_error(
  ErrorKind kind, SourceRange range, std::string message, std::string label,
  std::vector<std::string> notes)
{
  error_count_++;
  if (diags_ == nullptr) return;

  std::lock_guard<std::mutex> lock(report_mutex_);
  auto builder = diags_->report(kind, range, std::move(message), std::move(label));
  for (auto & note : notes) {
    builder.with_note(std::move(note));
  }
}

void Monomorphizer::trace(const std::string & line)
{
  if (log_ == nullptr) return;
  std::lock_guard<std::mutex> lock(report_mutex_);
  *log_ << line << "\n";
}

}  // namespace filament
