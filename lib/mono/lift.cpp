// filament/mono/lift.cpp - Concrete components back into the semantic model
#include "filament/mono/lift.hpp"

#include <unordered_map>

#include "filament/sema/check/type_checker.hpp"
#include "filament/solver/discharge.hpp"

namespace filament
{

bool lift_to_model(const MonoProgram & program, ComponentTable & table, DiagnosticBag * diags)
{
  ExprPool & pool = table.pool();

  for (const auto & mono : program.components) {
    ComponentDef * def = table.create(mono->name);
    if (def == nullptr) {
      if (diags != nullptr) {
        diags->report(
          ErrorKind::DuplicateDefinition, SourceRange{},
          "component '" + mono->name + "' is already defined");
      }
      return false;
    }

    def->is_extern = mono->is_extern;
    def->event = pool.intern(mono->event);
    def->delay = pool.constant(mono->delay);

    auto time = [&](int64_t offset) { return TimeExpr{def->event, pool.constant(offset)}; };

    auto lift_ports = [&](const std::vector<MonoPort> & ports, std::vector<PortDef> & out) {
      for (const auto & p : ports) {
        PortDef port;
        port.name = pool.intern(p.name);
        port.direction = p.direction;
        port.is_interface = p.is_interface;
        port.interval = Interval{time(p.start), time(p.end)};
        port.width = p.is_interface ? nullptr : pool.constant(p.width);
        out.push_back(port);
      }
    };
    lift_ports(mono->inputs, def->inputs);
    lift_ports(mono->outputs, def->outputs);

    for (const auto & [name, value] : mono->existentials) {
      ExistentialDef e;
      e.name = pool.intern(name);
      e.var = pool.exist(e.name);
      e.definition = pool.constant(value);
      def->existentials.push_back(e);
    }

    for (const auto & inst : mono->instances) {
      InstanceDef i;
      i.name = pool.intern(inst.name);
      i.component = inst.component != nullptr ? table.find(inst.component->name) : nullptr;
      def->instances.push_back(i);
    }

    auto lift_source = [&](const MonoSource & s) {
      PortSource src;
      src.kind = s.kind;
      src.invocation = pool.intern(s.invocation);
      src.port = pool.intern(s.port);
      src.constant = s.constant;
      return src;
    };

    for (const auto & inv : mono->invocations) {
      InvocationDef i;
      i.name = pool.intern(inv.name);
      i.instance = pool.intern(inv.instance);
      i.time = time(inv.start);
      for (const auto & a : inv.args) {
        i.args.push_back(lift_source(a));
      }
      def->invocations.push_back(std::move(i));
    }

    for (const auto & b : mono->bindings) {
      def->bindings.push_back(BindingDef{pool.intern(b.output), lift_source(b.src), SourceRange{}});
    }
  }
  return true;
}

size_t check_lifted(const ComponentTable & table, DiagnosticBag * diags, size_t * solver_queries)
{
  std::unordered_map<const ComponentDef *, CheckedComponent> checked;
  const CheckedLookup lookup = [&](const ComponentDef * def) -> const CheckedComponent * {
    auto it = checked.find(def);
    return it != checked.end() ? &it->second : nullptr;
  };

  SolverSession session;
  size_t failed = 0;
  for (const auto & def : table.components()) {
    TypeChecker checker(table.pool(), lookup, diags);
    CheckedComponent result = checker.check(*def);

    Discharger discharger(session, diags);
    const bool ok = !result.has_errors && discharger.discharge(result);
    if (!ok) failed++;
    checked.emplace(def.get(), std::move(result));
  }

  if (solver_queries != nullptr) {
    *solver_queries = session.query_count();
  }
  return failed;
}

}  // namespace filament
