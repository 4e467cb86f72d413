#pragma once

#include <ktree/core/types.h>
#include <ktree/graph/side_effects.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ktree::cli {

// Parse a JSON document from a file, or from stdin when `file` is "-"
Result<nlohmann::json> readJsonInput(const std::string& file);

// {"attempted": n, "modified": n, "failures": [{"path": ..., "error": ...}]}
nlohmann::json toJson(const graph::SideEffectReport& report);

void printJson(const nlohmann::json& j);

// One "[WARN] ..." line per warning on stderr
void printWarnings(const std::vector<std::string>& warnings);

} // namespace ktree::cli
