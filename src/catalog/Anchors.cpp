#include "catalog/Anchors.hpp"
#include "catalog/TextUtil.hpp"

#include <cctype>
#include <regex>

namespace catalog {
namespace anchors {

static const char* kCopyright = "\xC2\xA9";  // U+00A9
static const char* kBullet = "\xE2\x80\xA2"; // U+2022

bool is_ccn_header(const std::string& line) {
    static const std::regex re("CCN.*Course Number", std::regex::icase);
    return std::regex_search(line, re);
}

bool is_courses_section_break(const std::string& line) {
    static const std::regex re("^Courses", std::regex::icase);
    return std::regex_search(line, re);
}

bool is_program_outcomes(const std::string& line) {
    static const std::regex re("^Program Outcomes$", std::regex::icase);
    return std::regex_search(line, re);
}

bool is_school_of(const std::string& line) {
    static const std::regex re("^School of ", std::regex::icase);
    return std::regex_search(line, re);
}

bool is_college_heading(const std::string& line) {
    static const std::regex re("^(College|School) of ", std::regex::icase);
    return std::regex_search(line, re);
}

bool is_footer_copyright(const std::string& line) {
    return textutil::contains(line, kCopyright);
}

bool is_footer_total_cus(const std::string& line) {
    static const std::regex re("Total CUs", std::regex::icase);
    return std::regex_search(line, re);
}

bool is_program_title_noise(const std::string& line) {
    if (line.empty()) return false;
    if (textutil::starts_with(line, "Steps")) return true;
    if (std::isdigit(static_cast<unsigned char>(line[0]))) return true;
    if (line[0] == '-') return true;
    return textutil::starts_with(line, kBullet);
}

}  // namespace anchors
}  // namespace catalog
