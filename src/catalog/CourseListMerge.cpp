#include "catalog/CourseListMerge.hpp"
#include "catalog/TextUtil.hpp"

#include <set>
#include <stdexcept>
#include <unordered_map>

namespace catalog {

static const char* kNotFound = "NOT FOUND";

static std::vector<std::string> split_colleges(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ';') {
            out.push_back(textutil::trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(textutil::trim(cur));
    return out;
}

MergeResult merge_course_colleges(const io::CsvTable& with_college,
                                  const io::CsvTable& course_list,
                                  const CollegeRemap& remap) {
    const int wc_code = with_college.column("CourseCode");
    const int wc_colleges = with_college.column("Colleges");
    if (wc_code < 0 || wc_colleges < 0) {
        throw std::runtime_error("college table needs CourseCode and Colleges columns");
    }

    const int cl_code = course_list.column("CourseCode");
    if (cl_code < 0) throw std::runtime_error("course list needs a CourseCode column");

    std::unordered_map<std::string, std::string> colleges_by_code;
    for (const auto& row : with_college.rows) {
        std::set<std::string> remapped;
        for (const auto& c : split_colleges(row[wc_colleges])) {
            if (c.empty()) continue;
            auto it = remap.find(c);
            remapped.insert(it == remap.end() ? c : it->second);
        }
        colleges_by_code[textutil::trim(row[wc_code])] =
            textutil::join(std::vector<std::string>(remapped.begin(), remapped.end()), "; ");
    }

    MergeResult res;
    res.table.header = course_list.header;
    int out_col = res.table.column("Colleges");
    if (out_col < 0) {
        res.table.header.push_back("Colleges");
        out_col = static_cast<int>(res.table.header.size()) - 1;
    }

    for (const auto& row : course_list.rows) {
        res.total++;

        std::vector<std::string> out = row;
        out.resize(res.table.header.size());

        const std::string code = textutil::trim(row[cl_code]);
        auto it = colleges_by_code.find(code);
        if (it == colleges_by_code.end() || it->second.empty()) {
            out[out_col] = kNotFound;
            res.missing.push_back(code);
        } else {
            out[out_col] = it->second;
            res.found++;
        }

        res.table.rows.push_back(std::move(out));
    }

    return res;
}

}  // namespace catalog
