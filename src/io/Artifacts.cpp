#include "io/Artifacts.hpp"

#include "catalog/TextUtil.hpp"
#include "io/CsvIO.hpp"
#include "io/JsonIO.hpp"

#include <set>

namespace io {

using ojson = nlohmann::ordered_json;

ojson SectionsIndexArtifact::to_json() const {
    ojson j = ojson::object();
    for (const auto& d : index.dates()) {
        ojson dj = ojson::object();
        for (const auto& c : d.colleges) {
            ojson cj = ojson::object();
            for (const auto& ds : c.degrees) {
                cj[ds.degree] = ojson::array({ds.span.start_line, ds.span.stop_line});
            }
            dj[c.college] = cj;
        }
        j[d.catalog_date] = dj;
    }
    return j;
}

void SectionsIndexArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json_file(out_path, to_json());
}

ojson DegreeSnapshotsArtifact::to_json() const {
    ojson j = ojson::object();
    for (const auto& s : snapshots) {
        ojson sj = ojson::object();
        for (const auto& [college, degrees] : s.colleges) {
            sj[college] = degrees;
        }
        j[s.catalog_date] = sj;
    }
    return j;
}

void DegreeSnapshotsArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json_file(out_path, to_json());
}

static ojson instance_to_json(const catalog::CourseInstance& inst) {
    ojson j;
    j["catalog_date"] = inst.catalog_date;
    j["college"] = inst.college;
    j["degree"] = inst.degree;
    j["pattern"] = catalog::pattern_id_str(inst.pattern);
    j["raw"] = inst.raw;
    return j;
}

ojson CourseIndexArtifact::to_json() const {
    ojson j = ojson::object();
    for (const auto& e : index.entries()) {
        ojson ej;
        ej["canonical_title"] = e.canonical_title;
        ej["canonical_cus"] = e.canonical_credit_units;

        ojson arr = ojson::array();
        for (const auto& inst : e.instances) arr.push_back(instance_to_json(inst));
        ej["instances"] = arr;

        j[e.code] = ej;
    }
    return j;
}

void CourseIndexArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json_file(out_path, to_json());
}

std::vector<std::string> colleges_of(const catalog::CourseIndexEntry& e) {
    std::set<std::string> s;
    for (const auto& inst : e.instances) {
        std::string c = textutil::trim(inst.college);
        if (!c.empty()) s.insert(c);
    }
    return std::vector<std::string>(s.begin(), s.end());
}

void write_courses_flat_csv(const std::filesystem::path& out_path, const catalog::CourseIndex& index) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(index.size());
    for (const auto& e : index.entries()) {
        rows.push_back({textutil::trim(e.code), textutil::trim(e.canonical_title)});
    }
    write_csv(out_path, {"CourseCode", "CourseName"}, rows);
}

void write_courses_with_college_csv(const std::filesystem::path& out_path, const catalog::CourseIndex& index) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(index.size());
    for (const auto& e : index.entries()) {
        rows.push_back({textutil::trim(e.code), textutil::trim(e.canonical_title), textutil::join(colleges_of(e), "; ")});
    }
    write_csv(out_path, {"CourseCode", "CourseName", "Colleges"}, rows);
}

void write_string_array(const std::filesystem::path& out_path, const std::vector<std::string>& items) {
    write_json_file(out_path, ojson(items));
}

}  // namespace io
