// filament/ir/json_emitter.hpp - JSON form of a monomorphized program
//
// The hand-off format for back ends:
//
//   {"entry": "main",
//    "components": [{"name", "definition", "extern", "event", "delay",
//                    "params", "existentials", "ports", "instances",
//                    "invocations", "bindings"}, ...]}
//
// Components appear callees first. Port intervals are `[start, end]`
// cycle offsets, end exclusive.
//
#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "filament/basic/diagnostic.hpp"
#include "filament/mono/mono_component.hpp"

namespace filament
{

[[nodiscard]] nlohmann::json to_json(const MonoComponent & component);

[[nodiscard]] nlohmann::json to_json(const MonoProgram & program);

/// Pretty-printed JSON text.
[[nodiscard]] std::string to_json_string(const MonoProgram & program);

/// Write the program to `output_path`; failures are reported as Io errors.
bool write_ir_json(
  const MonoProgram & program, const std::filesystem::path & output_path, DiagnosticBag & diags);

}  // namespace filament
