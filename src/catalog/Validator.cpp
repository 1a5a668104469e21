#include "catalog/Validator.hpp"

#include "catalog/Anchors.hpp"
#include "catalog/CatalogDocument.hpp"
#include "catalog/CourseRowClassifier.hpp"
#include "io/JsonIO.hpp"

#include "nlohmann/json.hpp"

#include <set>
#include <sstream>
#include <tuple>

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace catalog {

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, const std::string& date = "") {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.catalog_date = date;
    rep.errors.push_back(std::move(e));
}

using SectionKey = std::tuple<std::string, std::string, std::string>;

static bool read_span(const json& v, size_t& start, size_t& stop) {
    if (!v.is_array() || v.size() != 2) return false;
    if (!v[0].is_number_unsigned() || !v[1].is_number_unsigned()) return false;
    start = v[0].get<size_t>();
    stop = v[1].get<size_t>();
    return true;
}

static void check_sections(const json& sections_j, const fs::path& text_dir,
                           ValidationReport& rep, std::set<SectionKey>& known) {
    if (!sections_j.is_object()) {
        add_error(rep, "bad_sections_index", "sections index root must be an object");
        return;
    }

    for (auto dit = sections_j.begin(); dit != sections_j.end(); ++dit) {
        const std::string& date = dit.key();
        const fs::path catalog_path = text_dir / ("catalog_" + date_file_stem(date) + ".txt");

        if (!fs::exists(catalog_path)) {
            add_error(rep, "unknown_date", "no catalog file for date: " + catalog_path.string(), date);
            continue;
        }
        if (!dit.value().is_object()) {
            add_error(rep, "bad_sections_index", "entry for date must be an object", date);
            continue;
        }

        const CatalogDocument doc = CatalogDocument::load(catalog_path);

        for (auto cit = dit.value().begin(); cit != dit.value().end(); ++cit) {
            if (!cit.value().is_object()) {
                add_error(rep, "bad_sections_index", "entry for college must be an object: " + cit.key(), date);
                continue;
            }
            for (auto git = cit.value().begin(); git != cit.value().end(); ++git) {
                const std::string where = cit.key() + " / " + git.key();
                rep.sections_checked++;

                size_t start = 0, stop = 0;
                if (!read_span(git.value(), start, stop)) {
                    add_error(rep, "bad_section", "section must be [start, stop]: " + where, date);
                    continue;
                }
                known.insert(SectionKey{date, cit.key(), git.key()});

                if (!(start < stop && stop <= doc.size())) {
                    std::ostringstream oss;
                    oss << "section [" << start << ", " << stop << ") outside 0.." << doc.size() << ": " << where;
                    add_error(rep, "section_out_of_bounds", oss.str(), date);
                    continue;
                }
                if (!anchors::is_ccn_header(doc.line(start))) {
                    add_error(rep, "section_not_anchored", "start line is not a CCN header: " + where, date);
                }
            }
        }
    }
}

static void check_courses(const json& courses_j, const std::set<SectionKey>& known, ValidationReport& rep) {
    if (!courses_j.is_object()) {
        add_error(rep, "bad_course_index", "course index root must be an object");
        return;
    }

    for (auto it = courses_j.begin(); it != courses_j.end(); ++it) {
        const std::string& code = it.key();
        const json& e = it.value();
        rep.courses_checked++;

        if (!e.is_object() || !e.contains("instances") || !e["instances"].is_array() || e["instances"].empty()) {
            add_error(rep, "bad_course_index", "entry needs a non-empty instances array: " + code);
            continue;
        }
        if (!e.contains("canonical_title") || !e["canonical_title"].is_string() ||
            !e.contains("canonical_cus") || !e["canonical_cus"].is_number_integer()) {
            add_error(rep, "bad_course_index", "entry needs canonical_title and integer canonical_cus: " + code);
            continue;
        }

        bool first = true;
        for (const auto& inst : e["instances"]) {
            if (!inst.is_object()) {
                add_error(rep, "bad_course_index", "instance must be an object: " + code);
                continue;
            }
            const std::string date = inst.value("catalog_date", "");
            const std::string college = inst.value("college", "");
            const std::string degree = inst.value("degree", "");
            const std::string raw = inst.value("raw", "");

            if (known.find(SectionKey{date, college, degree}) == known.end()) {
                add_error(rep, "unknown_section", code + " instance points at unknown section " + college + " / " + degree, date);
            }

            auto row = classify_course_row(raw);
            if (!row || !row->code || *row->code != code) {
                add_error(rep, "code_mismatch", "instance row does not classify to " + code + ": " + raw, date);
            } else if (first) {
                if (e["canonical_title"].get<std::string>() != row->title || e["canonical_cus"].get<int>() != row->credit_units) {
                    add_error(rep, "canonical_mismatch", code + " canonical title/CUs differ from its first instance", date);
                }
            }
            first = false;
        }
    }
}

ValidationReport validate_run(const ValidationInputs& in) {
    ValidationReport rep;

    if (!fs::exists(in.text_dir)) add_error(rep, "missing_file", "catalog text dir does not exist: " + in.text_dir);
    if (!fs::exists(in.sections_index_path)) add_error(rep, "missing_file", "sections index does not exist: " + in.sections_index_path);
    if (!fs::exists(in.course_index_path)) add_error(rep, "missing_file", "course index does not exist: " + in.course_index_path);

    if (!rep.pass) return rep;

    json sections_j;
    json courses_j;
    try {
        sections_j = io::read_json_file(in.sections_index_path);
        courses_j = io::read_json_file(in.course_index_path);
    } catch (const std::exception& e) {
        add_error(rep, "json_parse_error", e.what());
        return rep;
    }

    std::set<SectionKey> known;
    try {
        check_sections(sections_j, fs::path(in.text_dir), rep, known);
        check_courses(courses_j, known, rep);
    } catch (const std::exception& e) {
        // wrongly typed fields surface as nlohmann type errors
        add_error(rep, "validation_aborted", e.what());
    }

    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    json j;
    j["pass"] = rep.pass;
    j["sections_checked"] = rep.sections_checked;
    j["courses_checked"] = rep.courses_checked;
    j["errors"] = json::array();

    for (const auto& e : rep.errors) {
        json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.catalog_date.empty()) ej["catalog_date"] = e.catalog_date;
        j["errors"].push_back(ej);
    }

    io::write_json_file(path, j);
}

}  // namespace catalog
