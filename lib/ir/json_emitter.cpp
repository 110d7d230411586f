// filament/ir/json_emitter.cpp - JSON form of a monomorphized program
#include "filament/ir/json_emitter.hpp"

#include <fstream>

namespace filament
{

using json = nlohmann::json;

namespace
{

json ports_to_json(const std::vector<MonoPort> & ports)
{
  json out = json::array();
  for (const auto & p : ports) {
    json item;
    item["name"] = p.name;
    item["direction"] = p.direction == PortDirection::In ? "in" : "out";
    item["interface"] = p.is_interface;
    item["interval"] = json::array({p.start, p.end});
    if (p.is_interface) {
      item["width"] = nullptr;
    } else {
      item["width"] = p.width;
    }
    out.push_back(std::move(item));
  }
  return out;
}

json named_values(const std::vector<std::pair<std::string, int64_t>> & values)
{
  json out = json::object();
  for (const auto & [name, value] : values) {
    out[name] = value;
  }
  return out;
}

}  // namespace

json to_json(const MonoComponent & component)
{
  json j;
  j["name"] = component.name;
  j["definition"] = component.definition;
  j["extern"] = component.is_extern;
  j["event"] = component.event;
  j["delay"] = component.delay;
  j["params"] = named_values(component.params);
  j["existentials"] = named_values(component.existentials);

  json ports = ports_to_json(component.inputs);
  for (auto & p : ports_to_json(component.outputs)) {
    ports.push_back(std::move(p));
  }
  j["ports"] = std::move(ports);

  j["instances"] = json::array();
  for (const auto & inst : component.instances) {
    j["instances"].push_back(
      {{"name", inst.name},
       {"component", inst.component != nullptr ? json(inst.component->name) : json(nullptr)}});
  }

  j["invocations"] = json::array();
  for (const auto & inv : component.invocations) {
    json args = json::array();
    for (const auto & a : inv.args) {
      args.push_back(a.render());
    }
    j["invocations"].push_back(
      {{"name", inv.name}, {"instance", inv.instance}, {"start", inv.start}, {"args", args}});
  }

  j["bindings"] = json::array();
  for (const auto & b : component.bindings) {
    j["bindings"].push_back({{"dst", b.output}, {"src", b.src.render()}});
  }
  return j;
}

json to_json(const MonoProgram & program)
{
  json j;
  j["entry"] = program.entry != nullptr ? json(program.entry->name) : json(nullptr);
  j["components"] = json::array();
  for (const auto & c : program.components) {
    j["components"].push_back(to_json(*c));
  }
  return j;
}

std::string to_json_string(const MonoProgram & program) { return to_json(program).dump(2); }

bool write_ir_json(
  const MonoProgram & program, const std::filesystem::path & output_path, DiagnosticBag & diags)
{
  std::ofstream out(output_path);
  if (!out.is_open()) {
    diags.report(ErrorKind::Io, SourceRange{}, "failed to open output file: " + output_path.string());
    return false;
  }

  out << to_json_string(program) << "\n";
  if (!out) {
    diags.report(ErrorKind::Io, SourceRange{}, "failed to write output file: " + output_path.string());
    return false;
  }
  return true;
}

}  // namespace filament
