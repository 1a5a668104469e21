#pragma once
#include <optional>
#include <string>

namespace catalog {

// Row shapes, tried in declaration order; the first match wins.
enum class PatternId {
    CcnFull,   // DEPT NUMBER CODE Title CUs Term
    CodeOnly,  // CODE Title CUs Term
    Fallback   // Title CUs Term
};

const char* pattern_id_str(PatternId p);  // "CCN_FULL" | "CODE_ONLY" | "FALLBACK"

struct ClassifiedRow {
    PatternId pattern = PatternId::Fallback;

    // department/number only for CcnFull, code for CcnFull and CodeOnly
    std::optional<std::string> department;
    std::optional<std::string> number;
    std::optional<std::string> code;

    std::string title;
    int credit_units = 0;
    int term = 0;
};

// Never throws. nullopt means the row is an anomaly.
std::optional<ClassifiedRow> classify_course_row(const std::string& row);

}  // namespace catalog
