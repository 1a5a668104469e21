#pragma once
#include <string>
#include <vector>

#include "catalog/CatalogDocument.hpp"

namespace catalog {

struct CollegePrograms {
    std::string college;
    std::vector<std::string> degrees;  // raw names, listing order
};

// College -> raw degree names for one catalog date, in first-seen college order.
class ProgramNames {
public:
    // replaces the listing of an already known college but keeps its position
    void set(const std::string& college, std::vector<std::string> degrees);

    const std::vector<CollegePrograms>& colleges() const { return m_colleges; }
    bool empty() const { return m_colleges.empty(); }

    bool has_college(const std::string& college) const;
    const CollegePrograms* find(const std::string& college) const;

private:
    std::vector<CollegePrograms> m_colleges;
};

// Forward pass over the front matter (lines before the first CCN header).
// A college heading is a "School of ..." line or a line equal to one of valid_colleges.
ProgramNames extract_program_names(const CatalogDocument& doc,
                                   const std::vector<std::string>& valid_colleges);

}  // namespace catalog
