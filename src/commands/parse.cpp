#include "commands/parse.hpp"

#include "catalog/Config.hpp"
#include "catalog/Diagnostics.hpp"
#include "catalog/Errors.hpp"
#include "catalog/Pipeline.hpp"

#include <iostream>
#include <string>
#include <vector>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int parse_usage() {
    std::cerr
        << "usage:\n"
        << "  catalog-indexer parse [options]\n"
        << "\n"
        << "inputs:\n"
        << "  --text_dir <dir>             default: data/raw_catalog_texts\n"
        << "  --snapshots <path>           default: shared/college_snapshots.json\n"
        << "  --college_order <path>       default: same as --snapshots\n"
        << "  --duplicates <path>          default: shared/degree_duplicates_master.json\n"
        << "\n"
        << "outputs:\n"
        << "  --outdir <dir>               default: outputs\n"
        << "\n"
        << "behavior:\n"
        << "  --fence <mode>               sibling_or_college (default) | sibling_only\n"
        << "  --reuse_program_names        load an existing program_names listing instead of extracting\n"
        << "  --debug                      print every section span\n";
    return 1;
}

int cmd_parse(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return parse_usage();

    catalog::ConfigPaths paths;
    paths.text_dir = get_arg(argc, argv, "--text_dir", paths.text_dir.string());
    paths.snapshots = get_arg(argc, argv, "--snapshots", paths.snapshots.string());
    paths.college_order = get_arg(argc, argv, "--college_order", "");
    paths.duplicates = get_arg(argc, argv, "--duplicates", paths.duplicates.string());
    paths.outdir = get_arg(argc, argv, "--outdir", paths.outdir.string());

    catalog::RunOptions opts;
    opts.reuse_program_names = has_flag(argc, argv, "--reuse_program_names");

    const std::string fence = get_arg(argc, argv, "--fence", catalog::stop_fence_str(opts.fence));
    if (!catalog::parse_stop_fence(fence, opts.fence)) {
        std::cerr << "error: unknown --fence value: " << fence << "\n";
        return parse_usage();
    }

    catalog::Diagnostics diag;
    diag.out = &std::cout;
    diag.err = &std::cerr;
    diag.debug = has_flag(argc, argv, "--debug");

    try {
        const catalog::Config cfg = catalog::load_config(paths, opts);

        const catalog::PipelineResult res = catalog::run_catalog_pipeline(cfg, diag);
        const std::vector<std::string> outputs = catalog::write_run_outputs(cfg, res);

        std::cout << "\nCATALOGS: " << res.dates.size() << "\n";
        std::cout << "SECTIONS: " << res.sections.section_count() << "\n";
        std::cout << "COURSES: " << res.courses.index().size() << "\n";
        std::cout << "ANOMALIES: " << res.courses.anomalies().size() << "\n";
        std::cout << "ISSUES: " << res.failures.size() << "\n";
        for (const auto& p : outputs) std::cout << "OUT: " << p << "\n";
        return 0;
    } catch (const catalog::CatalogError& e) {
        std::cerr << "error: " << catalog::error_kind_str(e.kind()) << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
