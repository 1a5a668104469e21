#pragma once
#include <map>
#include <string>
#include <vector>

#include "io/CsvIO.hpp"

namespace catalog {

// old college name -> current name
using CollegeRemap = std::map<std::string, std::string>;

struct MergeResult {
    io::CsvTable table;                 // course list plus a Colleges column
    int total = 0;
    int found = 0;
    std::vector<std::string> missing;   // course codes without a college
};

// Joins a course list (needs CourseCode) with a courses_with_college table (needs
// CourseCode and Colleges). College names are remapped, deduplicated and sorted;
// unknown codes get "NOT FOUND".
MergeResult merge_course_colleges(const io::CsvTable& with_college,
                                  const io::CsvTable& course_list,
                                  const CollegeRemap& remap);

}  // namespace catalog
