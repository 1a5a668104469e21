#pragma once

#include <filesystem>
#include <string>

#include "catalog/DegreeSnapshotBuilder.hpp"
#include "catalog/SectionIndexer.hpp"
#include "catalog/Snapshots.hpp"

namespace catalog {

struct ConfigPaths {
    std::filesystem::path text_dir = "data/raw_catalog_texts";
    std::filesystem::path snapshots = "shared/college_snapshots.json";
    std::filesystem::path college_order;  // empty: same file as snapshots
    std::filesystem::path duplicates = "shared/degree_duplicates_master.json";
    std::filesystem::path outdir = "outputs";
};

struct RunOptions {
    StopFence fence = StopFence::SiblingOrCollege;
    bool reuse_program_names = false;  // prefer an existing program_names listing over extraction
};

// Where every artifact of a run lands, relative to outdir.
struct OutputLayout {
    std::filesystem::path outdir;

    std::filesystem::path helpers_dir() const { return outdir / "helpers"; }
    std::filesystem::path program_names_dir() const { return outdir / "program_names"; }
    std::filesystem::path raw_rows_dir() const { return outdir / "raw_course_rows"; }
    std::filesystem::path anomalies_dir() const { return outdir / "anomalies"; }

    std::filesystem::path sections_index() const { return helpers_dir() / "sections_index_v10.json"; }
    std::filesystem::path degree_snapshots() const { return helpers_dir() / "degree_snapshots_v10_seed.json"; }
    std::filesystem::path course_index() const { return helpers_dir() / "course_index_v10.json"; }
    std::filesystem::path courses_flat_csv() const { return outdir / "courses_flat_v10.csv"; }
    std::filesystem::path courses_with_college_csv() const { return outdir / "courses_with_college_v10.csv"; }

    // per catalog date ("YYYY-MM")
    std::filesystem::path program_names(const std::string& date) const;
    std::filesystem::path raw_rows(const std::string& date) const;
    std::filesystem::path anomalies(const std::string& date) const;
};

// Everything a run reads besides the catalogs, loaded once and passed around read-only.
struct Config {
    ConfigPaths paths;
    RunOptions options;
    OutputLayout layout;

    SnapshotMap valid_colleges;  // version -> colleges recognised as headings
    SnapshotMap college_order;   // version -> canonical college ordering
    DuplicatesMap duplicates;
};

// Reads and validates the snapshot and duplicates files. Performs no writes.
// Throws std::runtime_error on unreadable input, UnrecognizedDuplicatesFormat on a bad
// duplicates file.
Config load_config(const ConfigPaths& paths, const RunOptions& options = {});

}  // namespace catalog
