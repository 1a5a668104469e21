#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace catalog {

struct ValidationError {
    std::string code;
    std::string message;
    std::string catalog_date;
};

struct ValidationReport {
    bool pass = true;
    int sections_checked = 0;
    int courses_checked = 0;
    std::vector<ValidationError> errors;
};

struct ValidationInputs {
    std::string text_dir;
    std::string sections_index_path;
    std::string course_index_path;
};

// Re-reads a run's sections index and course index and checks them against the catalogs:
// every section in bounds and opened by a CCN header, every course instance pointing at a
// known section, and every canonical title/CUs matching the first instance's row.
ValidationReport validate_run(const ValidationInputs& in);
void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace catalog
