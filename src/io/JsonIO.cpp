#include "io/JsonIO.hpp"

#include "catalog/Errors.hpp"
#include "catalog/TextUtil.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

using json = nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace io {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::vector<std::string> require_string_array(const json& arr, const std::string& where) {
    require_array(arr, where);
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

json read_json_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open JSON file: " + path.string());
    }

    try {
        return json::parse(in);
    } catch (const std::exception& e) {
        throw std::runtime_error("failed to parse JSON " + path.string() + ": " + e.what());
    }
}

void write_json_file(const fs::path& path, const json& j) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());

    out << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

catalog::SnapshotMap parse_snapshot_map(const json& j, const std::string& where) {
    static const std::regex version_re("^\\d{4}-\\d{2}$");

    require_object(j, where);

    catalog::SnapshotMap out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!std::regex_match(it.key(), version_re)) {
            throw std::runtime_error(where + " key '" + it.key() + "' is not a YYYY-MM version");
        }
        out[it.key()] = require_string_array(it.value(), where + "." + it.key());
    }
    return out;
}

catalog::SnapshotMap load_snapshot_map(const fs::path& path) {
    return parse_snapshot_map(read_json_file(path), path.filename().string());
}

catalog::DuplicatesMap parse_duplicates(const json& j) {
    catalog::DuplicatesMap out;

    if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_string()) {
                throw catalog::UnrecognizedDuplicatesFormat("value for '" + it.key() + "' must be a string");
            }
            out[textutil::trim(it.key())] = textutil::trim(it.value().get<std::string>());
        }
        return out;
    }

    if (j.is_array()) {
        for (size_t i = 0; i < j.size(); ++i) {
            const json& e = j.at(i);
            if (!e.is_object() ||
                !e.contains("raw_degree_name") || !e.at("raw_degree_name").is_string() ||
                !e.contains("resolved_name") || !e.at("resolved_name").is_string()) {
                std::ostringstream oss;
                oss << "entry [" << i << "] needs string fields raw_degree_name and resolved_name";
                throw catalog::UnrecognizedDuplicatesFormat(oss.str());
            }
            out[textutil::trim(e.at("raw_degree_name").get<std::string>())] =
                textutil::trim(e.at("resolved_name").get<std::string>());
        }
        return out;
    }

    throw catalog::UnrecognizedDuplicatesFormat("expected an object of raw->resolved names or a list of "
                                                "{raw_degree_name, resolved_name} objects");
}

catalog::DuplicatesMap load_duplicates(const fs::path& path) {
    return parse_duplicates(read_json_file(path));
}

json program_names_to_json(const catalog::ProgramNames& programs) {
    json j = json::object();
    for (const auto& cp : programs.colleges()) {
        j[cp.college] = cp.degrees;
    }
    return j;
}

catalog::ProgramNames load_program_names(const fs::path& path) {
    const json j = read_json_file(path);
    const std::string where = path.filename().string();
    require_object(j, where);

    catalog::ProgramNames out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        out.set(it.key(), require_string_array(it.value(), where + "." + it.key()));
    }
    return out;
}

}  // namespace io
