#include "catalog/ProgramNames.hpp"
#include "catalog/Anchors.hpp"

#include <algorithm>

namespace catalog {

void ProgramNames::set(const std::string& college, std::vector<std::string> degrees) {
    for (auto& cp : m_colleges) {
        if (cp.college == college) {
            cp.degrees = std::move(degrees);
            return;
        }
    }
    m_colleges.push_back({college, std::move(degrees)});
}

bool ProgramNames::has_college(const std::string& college) const {
    return find(college) != nullptr;
}

const CollegePrograms* ProgramNames::find(const std::string& college) const {
    for (const auto& cp : m_colleges) {
        if (cp.college == college) return &cp;
    }
    return nullptr;
}

ProgramNames extract_program_names(const CatalogDocument& doc,
                                   const std::vector<std::string>& valid_colleges) {
    ProgramNames result;

    const size_t end = doc.find_ccn_header().value_or(doc.size());

    std::string current_college;
    std::vector<std::string> buffer;
    bool collecting = false;

    auto flush = [&]() {
        if (!current_college.empty() && !buffer.empty()) result.set(current_college, buffer);
        buffer.clear();
    };

    auto is_valid_college = [&](const std::string& line) {
        return std::find(valid_colleges.begin(), valid_colleges.end(), line) != valid_colleges.end();
    };

    for (size_t i = 0; i < end; ++i) {
        const std::string& line = doc.line(i);
        if (line.empty()) continue;

        if (anchors::is_school_of(line) || is_valid_college(line)) {
            flush();
            current_college = line;
            collecting = true;
            continue;
        }

        if (anchors::is_courses_section_break(line) ||
            anchors::is_program_outcomes(line) ||
            anchors::is_footer(line)) {
            flush();
            current_college.clear();
            collecting = false;
            continue;
        }

        if (collecting && !anchors::is_program_title_noise(line)) buffer.push_back(line);
    }

    flush();
    return result;
}

}  // namespace catalog
