// filament/sema/name_resolver.cpp - Name resolution implementation
//
#include "filament/sema/resolution/name_resolver.hpp"

#include <algorithm>

#include "filament/basic/casting.hpp"

namespace filament
{

namespace
{

const PortDecl * find_port(gsl::span<PortDecl * const> ports, std::string_view name)
{
  auto it = std::find_if(
    ports.begin(), ports.end(), [&](const PortDecl * p) { return p->name == name; });
  return it != ports.end() ? *it : nullptr;
}

const ExistsDecl * find_existential(const ComponentDecl & comp, std::string_view name)
{
  auto it = std::find_if(
    comp.existentials.begin(), comp.existentials.end(),
    [&](const ExistsDecl * e) { return e->name == name; });
  return it != comp.existentials.end() ? *it : nullptr;
}

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

}  // namespace

// ============================================================================
// Entry Point
// ============================================================================

bool NameResolver::resolve(Program & program)
{
  has_errors_ = false;
  error_count_ = 0;

  for (auto * comp : program.components) {
    visit_component_decl(comp);
  }
  return !has_errors_;
}

void NameResolver::visit_component_decl(ComponentDecl * node)
{
  current_ = node;
  defined_in_body_.clear();

  context_ = ExprContext::Signature;
  if (node->timeParam != nullptr) {
    visit(node->timeParam->delay);
  }
  for (auto * port : node->inputs) {
    visit(port->start);
    visit(port->end);
    visit(port->width);
  }
  for (auto * port : node->outputs) {
    visit(port->start);
    visit(port->end);
    visit(port->width);
  }
  for (auto * e : node->existentials) {
    visit(e->definition);
    for (auto * g : e->guards) {
      visit(g);
    }
  }
  for (auto * g : node->guards) {
    visit(g);
  }

  context_ = ExprContext::Body;
  for (auto * stmt : node->body) {
    visit(stmt);
  }
  current_ = nullptr;
}

// ============================================================================
// Expressions
// ============================================================================

void NameResolver::visit_name_expr(NameExpr * node)
{
  const Scope * scope = context_ == ExprContext::Body ? symbols_.get_body_scope(current_)
                                                      : symbols_.get_signature_scope(current_);
  const Symbol * sym = scope != nullptr ? scope->lookup(node->name) : nullptr;
  if (sym == nullptr) {
    report_error(
      node->get_range(), "unknown name " + quote_name(node->name) + " in component " +
                           quote_name(current_->name),
      "not found in this scope");
    return;
  }

  switch (sym->kind) {
    case SymbolKind::Param:
      break;
    case SymbolKind::Existential:
      if (context_ == ExprContext::InstanceArgs) {
        report_error(
          node->get_range(),
          "instance arguments may only use value parameters; " + quote_name(node->name) +
            " is an existential",
          "existential used here");
        return;
      }
      break;
    default:
      report_error(
        node->get_range(),
        quote_name(node->name) + " is " + std::string(to_string(sym->kind)) +
          ", not a value parameter or existential",
        "expected a value");
      return;
  }
  node->resolvedSymbol = sym;
}

void NameResolver::visit_member_expr(MemberExpr * node)
{
  if (context_ != ExprContext::Body) {
    report_error(
      node->get_range(),
      "existential " + quote_name(std::string(node->base) + "." + std::string(node->member)) +
        " is not visible here",
      "sub-instance existentials may only be used in the body");
    return;
  }

  const InstanceStmt * inst = instance_through(node->base);
  if (inst == nullptr) {
    report_error(
      node->get_range(), "unknown instance " + quote_name(node->base), "not found in this scope");
    return;
  }
  const ComponentDecl * callee = symbols_.find_component(inst->component);
  if (callee == nullptr) {
    return;  // reported at the instance
  }
  if (find_existential(*callee, node->member) == nullptr) {
    report_error(
      node->get_range(),
      "component " + quote_name(callee->name) + " has no existential " + quote_name(node->member),
      "unknown existential");
    return;
  }
  node->resolvedInstance = inst;
}

void NameResolver::visit_binary_expr(BinaryExpr * node)
{
  visit(node->lhs);
  visit(node->rhs);
}

void NameResolver::visit_call_expr(CallExpr * node) { visit(node->arg); }

void NameResolver::visit_time_point(TimePoint * node)
{
  const TimeParamDecl * event = current_->timeParam;
  if (event == nullptr || node->event != event->name) {
    report_error(
      node->eventRange,
      "unknown event " + quote_name(node->event) + "; component " + quote_name(current_->name) +
        " is scheduled by " + quote_name(event != nullptr ? event->name : std::string_view("?")),
      "unknown event");
  }
  visit(node->offset);
}

// ============================================================================
// Statements
// ============================================================================

void NameResolver::visit_instance_stmt(InstanceStmt * node)
{
  node->resolvedComponent = symbols_.find_component(node->component);
  if (node->resolvedComponent == nullptr) {
    report_error(
      node->componentRange, "unknown component " + quote_name(node->component),
      "no component with this name in the program or its imports");
  }

  context_ = ExprContext::InstanceArgs;
  for (auto * arg : node->args) {
    visit(arg);
  }
  context_ = ExprContext::Body;
}

void NameResolver::visit_invoke_stmt(InvokeStmt * node)
{
  const Scope * body = symbols_.get_body_scope(current_);
  const Symbol * sym = body->lookup(node->instance);
  if (sym == nullptr || sym->kind != SymbolKind::Instance) {
    report_error(
      node->instanceRange, "unknown instance " + quote_name(node->instance),
      sym == nullptr ? "not found in this scope" : "this is not an instance");
  } else {
    node->resolvedInstance = cast<InstanceStmt>(sym->astNode);
  }

  visit(node->time);
  for (auto * arg : node->args) {
    resolve_port_ref(arg, PortRole::Source);
  }
}

void NameResolver::visit_connect_stmt(ConnectStmt * node)
{
  resolve_port_ref(node->dst, PortRole::Sink);
  resolve_port_ref(node->src, PortRole::Source);
}

void NameResolver::visit_exists_def_stmt(ExistsDefStmt * node)
{
  const Symbol * sym = symbols_.get_signature_scope(current_)->lookup_local(node->name);
  if (sym == nullptr || sym->kind != SymbolKind::Existential) {
    report_error(
      node->get_range(),
      "existential " + quote_name(node->name) + " is not declared in the signature of " +
        quote_name(current_->name),
      "undeclared existential");
  } else {
    const auto * decl = cast<ExistsDecl>(sym->astNode);
    if (decl->definition != nullptr || !defined_in_body_.insert(node->name).second) {
      has_errors_ = true;
      error_count_++;
      if (diags_ != nullptr) {
        diags_
          ->report(
            ErrorKind::DuplicateDefinition, node->get_range(),
            "existential " + quote_name(node->name) + " is defined more than once", "redefined here")
          .with_secondary_label(decl->get_range(), "declared here");
      }
    } else {
      node->resolvedExists = decl;
    }
  }
  visit(node->value);
}

// ============================================================================
// Port references
// ============================================================================

void NameResolver::resolve_port_ref(PortRef * ref, PortRole role)
{
  if (ref->isConstant) {
    return;
  }

  const Scope * body = symbols_.get_body_scope(current_);

  if (ref->invocation.empty()) {
    const Symbol * sym = body->lookup(ref->port);
    if (sym == nullptr || sym->kind != SymbolKind::Port) {
      report_error(ref->get_range(), "unknown port " + quote_name(ref->port), "not a port");
      return;
    }
    const auto * port = cast<PortDecl>(sym->astNode);
    if (role == PortRole::Sink && port->direction != PortDirection::Out) {
      report_error(
        ref->get_range(), "no output port named " + quote_name(ref->port),
        "only outputs of the component can be bound");
      return;
    }
    if (role == PortRole::Source && (port->direction != PortDirection::In || port->isInterface)) {
      report_error(
        ref->get_range(), "no data input named " + quote_name(ref->port),
        port->isInterface ? "interface ports carry no data" : "outputs cannot be read");
      return;
    }
    ref->resolvedPort = port;
    return;
  }

  const Symbol * sym = body->lookup(ref->invocation);
  if (sym == nullptr || sym->kind != SymbolKind::Invocation) {
    report_error(
      ref->get_range(), "unknown invocation " + quote_name(ref->invocation),
      "not found in this scope");
    return;
  }
  const auto * inv = cast<InvokeStmt>(sym->astNode);
  if (role == PortRole::Sink) {
    report_error(
      ref->get_range(),
      "cannot bind to " + quote_name(std::string(ref->invocation) + "." + std::string(ref->port)),
      "only outputs of the component can be bound");
    return;
  }

  const InstanceStmt * inst = instance_through(inv->instance);
  const ComponentDecl * callee = inst ? symbols_.find_component(inst->component) : nullptr;
  if (callee == nullptr) {
    return;  // reported at the invocation or instance
  }
  const PortDecl * port = find_port(callee->outputs, ref->port);
  if (port == nullptr) {
    report_error(
      ref->get_range(),
      "component " + quote_name(callee->name) + " has no output " + quote_name(ref->port),
      "unknown output");
    return;
  }
  ref->resolvedPort = port;
  ref->resolvedInvoke = inv;
}

const InstanceStmt * NameResolver::instance_through(std::string_view name) const
{
  const Symbol * sym = symbols_.get_body_scope(current_)->lookup(name);
  if (sym == nullptr) {
    return nullptr;
  }
  if (sym->kind == SymbolKind::Instance) {
    return cast<InstanceStmt>(sym->astNode);
  }
  if (sym->kind == SymbolKind::Invocation) {
    const Symbol * target =
      symbols_.get_body_scope(current_)->lookup(cast<InvokeStmt>(sym->astNode)->instance);
    if (target != nullptr && target->kind == SymbolKind::Instance) {
      return cast<InstanceStmt>(target->astNode);
    }
  }
  return nullptr;
}

// ============================================================================
// Error Reporting
// ============================================================================

void NameResolver::report_error(SourceRange range, std::string message, std::string label)
{
  has_errors_ = true;
  error_count_++;
  if (diags_ != nullptr) {
    diags_->report(ErrorKind::UnboundIdentifier, range, std::move(message), std::move(label));
  }
}

}  // namespace filament
