// filament/mono/instantiation_graph.cpp - Concrete instantiation graph
#include "filament/mono/instantiation_graph.hpp"

#include <algorithm>
#include <optional>

namespace filament
{

namespace
{

std::string quote_name(std::string_view s) { return "'" + std::string(s) + "'"; }

}  // namespace

bool InstantiationGraph::build(const SpecKey & entry)
{
  nodes_.clear();
  index_.clear();
  post_order_.clear();
  stack_.clear();
  on_stack_.clear();
  has_errors_ = false;
  error_count_ = 0;

  const SourceRange use = entry.def != nullptr ? entry.def->range : SourceRange{};
  size_t index = 0;
  const bool ok = visit(entry, use, index);
  entry_ = index;
  return ok && !has_errors_;
}

const InstantiationGraph::Node * InstantiationGraph::find(const SpecKey & key) const
{
  auto it = index_.find(key);
  return it != index_.end() ? &nodes_[it->second] : nullptr;
}

bool InstantiationGraph::visit(const SpecKey & key, SourceRange use, size_t & index)
{
  if (on_stack_.count(key) != 0) {
    std::string path;
    auto from = std::find(stack_.begin(), stack_.end(), key);
    for (; from != stack_.end(); ++from) {
      path += from->render() + " -> ";
    }
    path += key.render();
    report_error(
      ErrorKind::InstantiationCycle, use, "infinite instantiation: " + path,
      "instantiates " + key.render() + " again",
      {"every instantiation of " + quote_name(key.def->name) + " with these arguments requires "
       "another one"});
    return false;
  }

  if (auto it = index_.find(key); it != index_.end()) {
    index = it->second;
    return true;
  }

  if (stack_.size() >= max_depth_) {
    std::string tail;
    const size_t shown = std::min<size_t>(stack_.size(), 4);
    for (size_t i = stack_.size() - shown; i < stack_.size(); ++i) {
      tail += stack_[i].render() + " -> ";
    }
    tail += key.render();
    report_error(
      ErrorKind::InstantiationCycle, use,
      "instantiation depth exceeds " + std::to_string(max_depth_) + " at " + key.render(),
      "instantiated here", {"... -> " + tail});
    return false;
  }

  const ComponentDef & def = *key.def;
  stack_.push_back(key);
  on_stack_.insert(key);

  index = nodes_.size();
  nodes_.push_back(Node{key, {}});
  index_.emplace(key, index);

  Environment env;
  for (size_t i = 0; i < def.params.size() && i < key.args.size(); ++i) {
    env.emplace(pool_.param(def.params[i]), key.args[i]);
  }

  bool ok = true;
  for (const auto & inst : def.instances) {
    if (inst.component == nullptr) continue;

    SpecKey child{inst.component, {}};
    bool args_ok = true;
    for (size_t i = 0; i < inst.args.size(); ++i) {
      const std::optional<int64_t> v = evaluate(inst.args[i], env);
      if (!v || *v < 0) {
        report_error(
          ErrorKind::GuardViolated, inst.range,
          "argument " + std::to_string(i + 1) + " of instance " + quote_name(inst.name) + " in " +
            key.render() + " is not a natural number",
          "instantiated here",
          {render(inst.args[i]) + " = " + (v ? std::to_string(*v) : std::string("undefined"))});
        args_ok = false;
        break;
      }
      child.args.push_back(*v);
    }
    if (!args_ok) {
      ok = false;
      continue;
    }

    if (!guards_hold(child, inst.range)) {
      ok = false;
      continue;
    }

    size_t target = 0;
    if (!visit(child, inst.range, target)) {
      ok = false;
      break;
    }
    nodes_[index].children.push_back(Edge{inst.name, target});
  }

  on_stack_.erase(key);
  stack_.pop_back();
  post_order_.push_back(index);
  return ok;
}

bool InstantiationGraph::guards_hold(const SpecKey & key, SourceRange use)
{
  Environment env;
  for (size_t i = 0; i < key.def->params.size() && i < key.args.size(); ++i) {
    env.emplace(pool_.param(key.def->params[i]), key.args[i]);
  }

  bool ok = true;
  for (const auto & g : key.def->guards) {
    const std::optional<int64_t> l = evaluate(g.cmp.lhs, env);
    const std::optional<int64_t> r = evaluate(g.cmp.rhs, env);
    if (l && r && holds(g.cmp.op, *l, *r)) continue;
    report_error(
      ErrorKind::GuardViolated, use,
      key.render() + " violates guard " + quote_name(render(g.cmp)), "instantiated here",
      {l && r ? "evaluates to " + std::to_string(*l) + " " + std::string(to_string(g.cmp.op)) +
                  " " + std::to_string(*r)
              : std::string("guard does not evaluate")});
    ok = false;
  }
  return ok;
}

void InstantiationGraph::report_error(
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
