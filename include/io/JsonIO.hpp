#pragma once

#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "core/EngineConfig.hpp"
#include "core/Models.hpp"
#include "topics/Taxonomy.hpp"

namespace insights {

// Records are read leniently: a field of the wrong type counts as missing, so the
// record is later skipped as malformed instead of failing the whole file.
// Throws std::runtime_error when the file cannot be opened or the root is not an array.
std::vector<ExperienceRecord> load_records(const std::string& path);
std::vector<ExperienceRecord> parse_records(const nlohmann::json& root);

Outcome parse_outcome(const std::string& s);

// Throws ConfigurationError on any problem.
std::shared_ptr<const Taxonomy> load_taxonomy(const std::string& path);
std::shared_ptr<const Taxonomy> parse_taxonomy(const nlohmann::json& root);
nlohmann::json taxonomy_to_json(const Taxonomy& taxonomy);

// Absent keys keep their defaults. Throws ConfigurationError on bad types or values.
EngineConfig load_engine_config(const std::string& path);
EngineConfig parse_engine_config(const nlohmann::json& root, EngineConfig base = {});

}  // namespace insights
