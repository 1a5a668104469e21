#include "catalog/Duplicates.hpp"
#include "catalog/TextUtil.hpp"

#include <stdexcept>

namespace catalog {

std::string resolve_degree_name(const std::string& raw, const DuplicatesMap& duplicates) {
    const std::string key = textutil::trim(raw);
    auto it = duplicates.find(key);
    if (it == duplicates.end()) return key;
    return textutil::trim(it->second);
}

DuplicatesMap duplicates_from_csv(const io::CsvTable& table) {
    const int raw_col = table.column("raw_degree_name");
    const int resolved_col = table.column("resolved_name");
    if (raw_col < 0 || resolved_col < 0) {
        throw std::runtime_error("duplicates CSV needs raw_degree_name and resolved_name columns");
    }

    DuplicatesMap out;
    for (const auto& row : table.rows) {
        const std::string raw = textutil::trim(row[raw_col]);
        const std::string resolved = textutil::trim(row[resolved_col]);
        if (resolved.empty()) continue;
        out[raw] = resolved;
    }
    return out;
}

}  // namespace catalog
