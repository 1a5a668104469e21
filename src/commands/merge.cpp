#include "commands/merge.hpp"

#include "catalog/CourseListMerge.hpp"
#include "io/CsvIO.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int merge_usage() {
    std::cerr
        << "usage:\n"
        << "  catalog-indexer merge --course_list <csv> [options]\n"
        << "\n"
        << "options:\n"
        << "  --with_college <csv>         default: outputs/courses_with_college_v10.csv\n"
        << "  --course_list <csv>          (required) must have a CourseCode column\n"
        << "  --remap <json>               optional {\"old college\": \"new college\"}\n"
        << "  --out <csv>                  default: outputs/course_list_with_college.csv\n";
    return 1;
}

static catalog::CollegeRemap load_remap(const std::string& path) {
    catalog::CollegeRemap remap;
    if (path.empty()) return remap;

    const nlohmann::ordered_json j = io::read_json_file(path);
    if (!j.is_object()) throw std::runtime_error("remap must be a JSON object: " + path);
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) throw std::runtime_error("remap value for '" + it.key() + "' must be a string");
        remap[it.key()] = it.value().get<std::string>();
    }
    return remap;
}

int cmd_merge(int argc, char** argv) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") return merge_usage();
    }

    const std::string with_college = get_arg(argc, argv, "--with_college", "outputs/courses_with_college_v10.csv");
    const std::string course_list = get_arg(argc, argv, "--course_list", "");
    const std::string remap_path = get_arg(argc, argv, "--remap", "");
    const std::string out_path = get_arg(argc, argv, "--out", "outputs/course_list_with_college.csv");

    if (course_list.empty()) return merge_usage();

    try {
        const catalog::CollegeRemap remap = load_remap(remap_path);
        const catalog::MergeResult res =
            catalog::merge_course_colleges(io::read_csv(with_college), io::read_csv(course_list), remap);

        io::write_csv(out_path, res.table.header, res.table.rows);

        std::cout << "--- Summary ---\n";
        std::cout << "Total courses: " << res.total << "\n";
        std::cout << "Found: " << res.found << "\n";
        std::cout << "Missing: " << res.missing.size() << "\n";
        for (const auto& code : res.missing) std::cerr << "[MISSING] " << code << "\n";
        std::cout << "OUT: " << out_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
