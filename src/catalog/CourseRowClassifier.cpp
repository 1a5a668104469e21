#include "catalog/CourseRowClassifier.hpp"

#include <array>
#include <limits>
#include <regex>

namespace catalog {

const char* pattern_id_str(PatternId p) {
    switch (p) {
        case PatternId::CcnFull: return "CCN_FULL";
        case PatternId::CodeOnly: return "CODE_ONLY";
        case PatternId::Fallback: return "FALLBACK";
    }
    return "UNKNOWN";
}

static const std::regex& pattern_regex(PatternId p) {
    static const std::regex ccn_full(R"(^([A-Z]{2,5})\s+(\d{1,4})\s+([A-Z0-9]{2,5})\s+(.+?)\s+(\d+)\s+(\d+)$)");
    static const std::regex code_only(R"(^([A-Z0-9]{1,6})\s+(.+?)\s+(\d+)\s+(\d+)$)");
    static const std::regex fallback(R"(^(.+?)\s+(\d+)\s+(\d+)$)");

    switch (p) {
        case PatternId::CcnFull: return ccn_full;
        case PatternId::CodeOnly: return code_only;
        case PatternId::Fallback: return fallback;
    }
    return fallback;
}

// digits-only capture -> int; false when it does not fit
static bool to_int(const std::string& digits, int& out) {
    long long v = 0;
    for (char c : digits) {
        v = v * 10 + (c - '0');
        if (v > std::numeric_limits<int>::max()) return false;
    }
    out = static_cast<int>(v);
    return true;
}

static std::optional<ClassifiedRow> build_row(PatternId p, const std::smatch& m) {
    ClassifiedRow r;
    r.pattern = p;

    size_t title_group = 0;
    switch (p) {
        case PatternId::CcnFull:
            r.department = m[1].str();
            r.number = m[2].str();
            r.code = m[3].str();
            title_group = 4;
            break;
        case PatternId::CodeOnly:
            r.code = m[1].str();
            title_group = 2;
            break;
        case PatternId::Fallback:
            title_group = 1;
            break;
    }

    r.title = m[title_group].str();
    if (!to_int(m[title_group + 1].str(), r.credit_units)) return std::nullopt;
    if (!to_int(m[title_group + 2].str(), r.term)) return std::nullopt;
    return r;
}

std::optional<ClassifiedRow> classify_course_row(const std::string& row) {
    static const std::array<PatternId, 3> order = {
        PatternId::CcnFull,
        PatternId::CodeOnly,
        PatternId::Fallback,
    };

    for (PatternId p : order) {
        std::smatch m;
        if (!std::regex_match(row, m, pattern_regex(p))) continue;
        // the first matching shape decides, even if its numbers are unusable
        return build_row(p, m);
    }
    return std::nullopt;
}

}  // namespace catalog
