#pragma once
#include <map>
#include <string>

#include "io/CsvIO.hpp"

namespace catalog {

// raw degree name -> canonical degree name; identity when a name is absent
using DuplicatesMap = std::map<std::string, std::string>;

// trimmed lookup; the result is trimmed too
std::string resolve_degree_name(const std::string& raw, const DuplicatesMap& duplicates);

// Hand-maintained CSV with raw_degree_name,resolved_name columns. Rows with an empty
// resolved_name are skipped. Throws std::runtime_error when a column is missing.
DuplicatesMap duplicates_from_csv(const io::CsvTable& table);

}  // namespace catalog
