#pragma once

#include <map>
#include <string>
#include <vector>

#include "catalog/Config.hpp"
#include "catalog/CourseIndex.hpp"
#include "catalog/DegreeSnapshotBuilder.hpp"
#include "catalog/Diagnostics.hpp"
#include "catalog/ProgramNames.hpp"
#include "catalog/SectionIndexer.hpp"

namespace catalog {

enum class IndexMode {
    Headings,    // program listing found, one section per listed degree
    UpwardScan,  // no listing, single best-guess section
    Skipped      // no section could be located
};

const char* index_mode_str(IndexMode m);

struct DateSummary {
    std::string catalog_date;
    std::string source_file;
    IndexMode mode = IndexMode::Skipped;
    int sections_found = 0;
    int section_issues = 0;
    int rows = 0;
    int indexed = 0;
    int anomalies = 0;
};

struct PipelineResult {
    std::vector<DateSummary> dates;                    // catalog files in filename order
    std::map<std::string, ProgramNames> program_names; // by catalog date
    std::vector<SectionFailure> failures;              // non-fatal, per degree or per file

    SectionsIndex sections;
    CourseIndexAggregator courses;
    std::vector<DegreeSnapshot> degree_snapshots;
};

// Processes every catalog under cfg.paths.text_dir. Nothing is written.
// Per-file structural problems are logged and recorded in `failures`; configuration level
// violations (NoApplicableSnapshot, DuplicateCertificateError, MissingCollegeError) throw.
PipelineResult run_catalog_pipeline(const Config& cfg, const Diagnostics& diag);

// Writes all artifacts of a finished run and returns the paths written.
std::vector<std::string> write_run_outputs(const Config& cfg, const PipelineResult& res);

}  // namespace catalog
