#pragma once

#include "config/node_config.hpp"
#include "core/json_dom.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace camlink::config {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Reads a NodeConfig out of a JSON object.
//
// Contract:
// - absent fields keep their defaults
// - every problem is appended to `report.issues` with its JSON path, prefixed
//   by `path_prefix` ("" for a standalone file, "controllers[1].node" inside
//   a simulation plan)
// - unknown fields are reported so typos do not silently fall back to
//   defaults
// - `report.valid` is not touched; callers decide once all sections are read
void ReadNodeConfig(const core::json::Value& root, std::string_view path_prefix,
                    NodeConfig& config, ValidationReport& report);

// Parses and validates configuration text.
//
// Contract:
// - returns true when validation completed (even if the config is invalid)
// - JSON syntax errors become one issue under path `$`
// - populates `report.valid`; `config` is meaningful only when valid
bool LoadNodeConfigText(std::string_view json_text, NodeConfig& config, ValidationReport& report,
                        std::string& error);

// Same as LoadNodeConfigText; returns false when the file cannot be read.
bool LoadNodeConfigFile(const std::string& path, NodeConfig& config, ValidationReport& report,
                        std::string& error);

// One "path: message" line per issue.
std::string FormatValidationIssues(const ValidationReport& report);

} // namespace camlink::config
