// filament/sema/model/model_builder.cpp - AST lowering
#include "filament/sema/model/model_builder.hpp"

#include "filament/basic/casting.hpp"

namespace filament
{

// ============================================================================
// Entry Points
// ============================================================================

bool ModelBuilder::build(const ModuleGraph & graph)
{
  has_errors_ = false;
  error_count_ = 0;

  // Declare first: instances may name components of any module.
  for (const ModuleInfo * module : graph.modules()) {
    if (module->program == nullptr) continue;
    for (const ComponentDecl * comp : module->program->components) {
      declare(*comp);
    }
  }
  for (const ModuleInfo * module : graph.modules()) {
    if (module->program == nullptr) continue;
    for (const ComponentDecl * comp : module->program->components) {
      if (ComponentDef * def = table_.find(comp->name)) {
        lower(*comp, *def);
      }
    }
  }
  return !has_errors_;
}

bool ModelBuilder::build(const Program & program)
{
  has_errors_ = false;
  error_count_ = 0;

  for (const ComponentDecl * comp : program.components) {
    declare(*comp);
  }
  for (const ComponentDecl * comp : program.components) {
    if (ComponentDef * def = table_.find(comp->name)) {
      lower(*comp, *def);
    }
  }
  return !has_errors_;
}

void ModelBuilder::declare(const ComponentDecl & decl)
{
  if (table_.create(decl.name) == nullptr) {
    report_error(
      ErrorKind::DuplicateDefinition, decl.nameRange,
      "component '" + std::string(decl.name) + "' is defined more than once");
  }
}

// ============================================================================
// Components
// ============================================================================

void ModelBuilder::lower(const ComponentDecl & decl, ComponentDef & def)
{
  def.is_extern = decl.isExtern;
  def.range = decl.get_range();

  for (const ParamDecl * p : decl.params) {
    def.params.push_back(pool_.intern(p->name));
  }

  if (decl.timeParam != nullptr) {
    def.event = pool_.intern(decl.timeParam->name);
    def.delay = lower_expr(decl.timeParam->delay);
    def.delay_range = decl.timeParam->delay->get_range();
  } else {
    def.delay = pool_.constant(1);
  }

  for (const PortDecl * port : decl.inputs) {
    def.inputs.push_back(lower_port(*port, def.event));
  }
  for (const PortDecl * port : decl.outputs) {
    def.outputs.push_back(lower_port(*port, def.event));
  }

  for (const ExistsDecl * e : decl.existentials) {
    ExistentialDef ex;
    ex.name = pool_.intern(e->name);
    ex.var = pool_.exist(e->name);
    ex.range = e->get_range();
    if (e->definition != nullptr) {
      ex.definition = lower_expr(e->definition);
      ex.definition_range = e->definition->get_range();
    }
    for (const Expr * g : e->guards) {
      if (auto cmp = lower_comparison(g)) {
        ex.guards.push_back(Guard{*cmp, g->get_range()});
      }
    }
    def.existentials.push_back(std::move(ex));
  }

  for (const Expr * g : decl.guards) {
    if (auto cmp = lower_comparison(g)) {
      def.guards.push_back(Guard{*cmp, g->get_range()});
    }
  }

  for (const Stmt * stmt : decl.body) {
    if (const auto * inst = dyn_cast<InstanceStmt>(stmt)) {
      InstanceDef out;
      out.name = pool_.intern(inst->name);
      out.component = table_.find(inst->component);
      out.range = inst->get_range();
      for (const Expr * arg : inst->args) {
        out.args.push_back(lower_expr(arg));
      }
      def.instances.push_back(std::move(out));
    } else if (const auto * inv = dyn_cast<InvokeStmt>(stmt)) {
      InvocationDef out;
      out.name = pool_.intern(inv->name);
      out.instance = pool_.intern(inv->instance);
      out.time = lower_time(inv->time, def.event);
      out.range = inv->get_range();
      for (const PortRef * arg : inv->args) {
        out.args.push_back(lower_source(*arg));
      }
      def.invocations.push_back(std::move(out));
    } else if (const auto * conn = dyn_cast<ConnectStmt>(stmt)) {
      BindingDef out;
      out.output = pool_.intern(conn->dst->port);
      out.src = lower_source(*conn->src);
      out.range = conn->get_range();
      def.bindings.push_back(std::move(out));
    } else if (const auto * ed = dyn_cast<ExistsDefStmt>(stmt)) {
      for (auto & ex : def.existentials) {
        if (ex.name == ed->name) {
          ex.definition = lower_expr(ed->value);
          ex.definition_range = ed->get_range();
        }
      }
    }
  }
}

PortDef ModelBuilder::lower_port(const PortDecl & port, std::string_view event)
{
  PortDef out;
  out.name = pool_.intern(port.name);
  out.direction = port.direction;
  out.is_interface = port.isInterface;
  out.range = port.get_range();
  out.interval.start = lower_time(port.start, event);
  if (port.isInterface) {
    out.interval.end = shift(pool_, out.interval.start, pool_.constant(1));
  } else {
    out.interval.end = lower_time(port.end, event);
    out.width = lower_expr(port.width);
  }
  return out;
}

PortSource ModelBuilder::lower_source(const PortRef & ref)
{
  PortSource out;
  out.range = ref.get_range();
  if (ref.isConstant) {
    out.kind = PortSource::Kind::Constant;
    out.constant = ref.constant;
  } else if (ref.invocation.empty()) {
    out.kind = PortSource::Kind::Own;
    out.port = pool_.intern(ref.port);
  } else {
    out.kind = PortSource::Kind::Invocation;
    out.invocation = pool_.intern(ref.invocation);
    out.port = pool_.intern(ref.port);
  }
  return out;
}

// ============================================================================
// Expressions
// ============================================================================

TimeExpr ModelBuilder::lower_time(const TimePoint * tp, std::string_view event)
{
  TimeExpr out;
  out.event = event;
  out.offset = (tp != nullptr && tp->offset != nullptr) ? lower_expr(tp->offset)
                                                        : pool_.constant(0);
  return out;
}

const ValueExpr * ModelBuilder::lower_expr(const Expr * expr)
{
  if (expr == nullptr) {
    return pool_.constant(0);
  }

  if (const auto * lit = dyn_cast<IntLiteralExpr>(expr)) {
    return pool_.constant(lit->value);
  }
  if (const auto * name = dyn_cast<NameExpr>(expr)) {
    if (name->resolvedSymbol != nullptr && name->resolvedSymbol->kind == SymbolKind::Existential) {
      return pool_.exist(name->name);
    }
    return pool_.param(name->name);
  }
  if (const auto * member = dyn_cast<MemberExpr>(expr)) {
    const std::string_view inst =
      member->resolvedInstance != nullptr ? member->resolvedInstance->name : member->base;
    return pool_.instance_exist(inst, member->member);
  }
  if (const auto * call = dyn_cast<CallExpr>(expr)) {
    return pool_.call(call->fn, lower_expr(call->arg));
  }
  if (const auto * bin = dyn_cast<BinaryExpr>(expr)) {
    if (is_comparison(bin->op)) {
      report_error(
        ErrorKind::Syntax, bin->get_range(), "comparison used where a value is expected");
      return pool_.constant(0);
    }
    return pool_.binary(bin->op, lower_expr(bin->lhs), lower_expr(bin->rhs));
  }
  return pool_.constant(0);
}

std::optional<Comparison> ModelBuilder::lower_comparison(const Expr * expr)
{
  const auto * bin = dyn_cast<BinaryExpr>(expr);
  const auto op = bin != nullptr ? to_cmp_op(bin->op) : std::nullopt;
  if (!op) {
    report_error(
      ErrorKind::Syntax, expr->get_range(), "guard must be a comparison such as 'W > 0'");
    return std::nullopt;
  }
  return Comparison{*op, lower_expr(bin->lhs), lower_expr(bin->rhs)};
}

void ModelBuilder::report_error(ErrorKind kind, SourceRange range, std::string message)
{
  has_errors_ = true;
  error_count_++;
  if (diags_ != nullptr) {
    diags_->report(kind, range, std::move(message));
  }
}

}  // namespace filament
