#include "commands/validate.hpp"

#include "catalog/Config.hpp"
#include "catalog/Validator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  catalog-indexer validate [--text_dir <dir>] [--outdir <dir>] [--sections <path>] [--courses <path>] [--out <path>]\n";
    return 1;
}

int cmd_validate(int argc, char** argv) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") return validate_usage();
    }

    catalog::OutputLayout layout;
    layout.outdir = get_arg(argc, argv, "--outdir", "outputs");

    catalog::ValidationInputs vin;
    vin.text_dir = get_arg(argc, argv, "--text_dir", "data/raw_catalog_texts");
    vin.sections_index_path = get_arg(argc, argv, "--sections", layout.sections_index().string());
    vin.course_index_path = get_arg(argc, argv, "--courses", layout.course_index().string());
    const std::string out_path = get_arg(argc, argv, "--out", (layout.helpers_dir() / "validation_report.json").string());

    try {
        const catalog::ValidationReport rep = catalog::validate_run(vin);
        catalog::write_validation_report(fs::path(out_path), rep);

        if (!rep.pass) {
            std::cerr << "validation failed: wrote " << out_path << "\n";
            for (const auto& e : rep.errors) {
                std::cerr << "- " << e.code << ": " << e.message;
                if (!e.catalog_date.empty()) std::cerr << " (catalog_date=" << e.catalog_date << ")";
                std::cerr << "\n";
            }
            return 1;
        }

        std::cout << "VALIDATION: pass (" << rep.sections_checked << " sections, " << rep.courses_checked << " courses)\n";
        std::cout << "OUT_VALIDATE: " << out_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
