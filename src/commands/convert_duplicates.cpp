#include "commands/convert_duplicates.hpp"

#include "catalog/Duplicates.hpp"
#include "io/CsvIO.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int convert_usage() {
    std::cerr
        << "usage:\n"
        << "  catalog-indexer convert-duplicates [--in <csv>] [--out <json>]\n"
        << "\n"
        << "  --in <csv>                   default: shared/degree_duplicates_master.csv\n"
        << "  --out <json>                 default: shared/degree_duplicates_master.json\n";
    return 1;
}

int cmd_convert_duplicates(int argc, char** argv) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") return convert_usage();
    }

    const std::string in_path = get_arg(argc, argv, "--in", "shared/degree_duplicates_master.csv");
    const std::string out_path = get_arg(argc, argv, "--out", "shared/degree_duplicates_master.json");

    try {
        const catalog::DuplicatesMap dups = catalog::duplicates_from_csv(io::read_csv(in_path));

        nlohmann::ordered_json j = nlohmann::ordered_json::object();
        for (const auto& [raw, resolved] : dups) j[raw] = resolved;
        io::write_json_file(out_path, j);

        std::cout << "Saved: " << out_path << " (" << dups.size() << " entries)\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
