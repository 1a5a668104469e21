#include "catalog/Config.hpp"
#include "catalog/CatalogDocument.hpp"
#include "io/JsonIO.hpp"

#include <stdexcept>

namespace fs = std::filesystem;

namespace catalog {

fs::path OutputLayout::program_names(const std::string& date) const {
    return program_names_dir() / (date_file_stem(date) + "_program_names_v10.json");
}

fs::path OutputLayout::raw_rows(const std::string& date) const {
    return raw_rows_dir() / (date_file_stem(date) + "_raw_course_rows_v10.json");
}

fs::path OutputLayout::anomalies(const std::string& date) const {
    return anomalies_dir() / ("anomalies_" + date_file_stem(date) + ".json");
}

Config load_config(const ConfigPaths& paths, const RunOptions& options) {
    Config cfg;
    cfg.paths = paths;
    cfg.options = options;
    cfg.layout.outdir = paths.outdir;

    if (!fs::exists(paths.snapshots)) throw std::runtime_error("snapshot file not found: " + paths.snapshots.string());
    cfg.valid_colleges = io::load_snapshot_map(paths.snapshots);

    if (paths.college_order.empty() || paths.college_order == paths.snapshots) {
        cfg.college_order = cfg.valid_colleges;
    } else {
        if (!fs::exists(paths.college_order)) throw std::runtime_error("college order file not found: " + paths.college_order.string());
        cfg.college_order = io::load_snapshot_map(paths.college_order);
    }

    if (!fs::exists(paths.duplicates)) throw std::runtime_error("duplicates file not found: " + paths.duplicates.string());
    cfg.duplicates = io::load_duplicates(paths.duplicates);

    return cfg;
}

}  // namespace catalog
