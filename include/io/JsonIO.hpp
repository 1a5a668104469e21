#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"

#include "catalog/DegreeSnapshotBuilder.hpp"
#include "catalog/ProgramNames.hpp"
#include "catalog/Snapshots.hpp"

namespace io {

nlohmann::ordered_json read_json_file(const std::filesystem::path& path);

// pretty-printed, invalid UTF-8 replaced instead of throwing
void write_json_file(const std::filesystem::path& path, const nlohmann::ordered_json& j);

// {"YYYY-MM": ["College", ...], ...}
catalog::SnapshotMap parse_snapshot_map(const nlohmann::ordered_json& j, const std::string& where);
catalog::SnapshotMap load_snapshot_map(const std::filesystem::path& path);

// Flat {"raw": "canonical"} or [{"raw_degree_name": ..., "resolved_name": ...}].
// Anything else throws UnrecognizedDuplicatesFormat.
catalog::DuplicatesMap parse_duplicates(const nlohmann::ordered_json& j);
catalog::DuplicatesMap load_duplicates(const std::filesystem::path& path);

// {"College": ["Degree", ...], ...}, key order preserved
nlohmann::ordered_json program_names_to_json(const catalog::ProgramNames& programs);
catalog::ProgramNames load_program_names(const std::filesystem::path& path);

}  // namespace io
