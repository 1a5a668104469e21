#pragma once
#include <string>

namespace catalog {

// Structural anchors, each tested against one trimmed catalog line.
namespace anchors {

bool is_ccn_header(const std::string& line);           // "CCN ... Course Number" anywhere, any case
bool is_courses_section_break(const std::string& line); // ^Courses
bool is_program_outcomes(const std::string& line);      // ^Program Outcomes$
bool is_school_of(const std::string& line);             // ^School of
bool is_college_heading(const std::string& line);       // ^College of / ^School of
bool is_footer_copyright(const std::string& line);      // contains the copyright sign
bool is_footer_total_cus(const std::string& line);      // "Total CUs" anywhere, any case

inline bool is_footer(const std::string& line) {
    return is_footer_copyright(line) || is_footer_total_cus(line);
}

// front-matter lines that are never program titles: "Steps...", digits, bullets, dashes
bool is_program_title_noise(const std::string& line);

}  // namespace anchors

}  // namespace catalog
