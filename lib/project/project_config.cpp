// filament/project/project_config.cpp - Project configuration implementation
//
#include "filament/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace filament
{

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of the configuration must be a map");
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'compiler' section
  if (root["compiler"]) {
    const auto & comp = root["compiler"];

    if (comp["entry_points"]) {
      if (!comp["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("compiler.entry_points must be a list");
      }
      for (const auto & ep : comp["entry_points"]) {
        config.compiler.entry_points.emplace_back(ep.as<std::string>());
      }
    }

    if (comp["top"]) {
      config.compiler.top = comp["top"].as<std::string>();
    }

    if (comp["params"]) {
      if (!comp["params"].IsMap()) {
        return ConfigLoadResult::fail("compiler.params must be a map of name: value");
      }
      for (const auto & kv : comp["params"]) {
        const auto name = kv.first.as<std::string>();
        const auto value = kv.second.as<int64_t>();
        if (value < 0) {
          return ConfigLoadResult::fail(
            "compiler.params." + name + " must be a natural number, got " + std::to_string(value));
        }
        config.compiler.params[name] = value;
      }
    }

    if (comp["output_dir"]) {
      config.compiler.output_dir = comp["output_dir"].as<std::string>();
    }

    if (comp["jobs"]) {
      const auto jobs = comp["jobs"].as<int64_t>();
      if (jobs < 1) {
        return ConfigLoadResult::fail("compiler.jobs must be at least 1");
      }
      config.compiler.jobs = static_cast<size_t>(jobs);
    }

    if (comp["fail_fast"]) {
      config.compiler.fail_fast = comp["fail_fast"].as<bool>();
    }
  }

  // Parse 'solver' section
  if (root["solver"]) {
    const auto & solver = root["solver"];
    if (solver["show_models"]) {
      config.solver.show_models = solver["show_models"].as<bool>();
    }
    if (solver["timeout_ms"]) {
      config.solver.timeout_ms = solver["timeout_ms"].as<unsigned>();
    }
    if (solver["dump_queries"]) {
      config.solver.dump_queries = project_root / solver["dump_queries"].as<std::string>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace filament
