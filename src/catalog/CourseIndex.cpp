#include "catalog/CourseIndex.hpp"
#include "catalog/Anchors.hpp"

#include <algorithm>
#include <set>

namespace catalog {

const CourseIndexEntry* CourseIndex::find(const std::string& code) const {
    auto it = m_pos.find(code);
    if (it == m_pos.end()) return nullptr;
    return &m_entries[it->second];
}

CourseIndexEntry& CourseIndex::upsert(const std::string& code, const std::string& title, int credit_units) {
    auto it = m_pos.find(code);
    if (it != m_pos.end()) return m_entries[it->second];

    CourseIndexEntry e;
    e.code = code;
    e.canonical_title = title;
    e.canonical_credit_units = credit_units;
    m_pos.emplace(code, m_entries.size());
    m_entries.push_back(std::move(e));
    return m_entries.back();
}

const char* anomaly_reason_str(AnomalyReason r) {
    switch (r) {
        case AnomalyReason::Unmatched: return "unmatched";
        case AnomalyReason::NoCode: return "no_code";
    }
    return "unknown";
}

SectionScanStats CourseIndexAggregator::add_section(const CatalogDocument& doc,
                                                    const std::string& college,
                                                    const std::string& degree,
                                                    const Section& section) {
    SectionScanStats st;
    const std::string& date = doc.catalog_date();
    std::vector<std::string>& raw_rows = m_raw_rows[date];
    std::set<size_t>& raw_row_lines = m_raw_row_lines[date];

    const size_t stop = std::min(section.stop_line, doc.size());
    bool in_block = true;  // start_line is the CCN header itself

    for (size_t i = section.start_line + 1; i < stop; ++i) {
        const std::string& line = doc.line(i);

        if (anchors::is_ccn_header(line)) {
            in_block = true;
            continue;
        }
        if (anchors::is_footer(line)) {
            in_block = false;
            continue;
        }
        if (!in_block || line.empty()) continue;

        st.rows++;
        if (raw_row_lines.insert(i).second) raw_rows.push_back(line);

        auto row = classify_course_row(line);
        if (!row || !row->code) {
            m_anomalies.push_back({date, college, degree, line, row ? AnomalyReason::NoCode : AnomalyReason::Unmatched, i});
            st.anomalies++;
            continue;
        }

        CourseIndexEntry& e = m_index.upsert(*row->code, row->title, row->credit_units);
        e.instances.push_back({date, college, degree, row->pattern, line});
        st.indexed++;
    }

    return st;
}

SectionScanStats CourseIndexAggregator::add_date(const CatalogDocument& doc, const DateSections& sections) {
    SectionScanStats total;
    for (const auto& c : sections.colleges) {
        for (const auto& ds : c.degrees) {
            SectionScanStats st = add_section(doc, c.college, ds.degree, ds.span);
            total.rows += st.rows;
            total.indexed += st.indexed;
            total.anomalies += st.anomalies;
        }
    }
    return total;
}

std::vector<std::string> CourseIndexAggregator::anomaly_lines(const std::string& catalog_date) const {
    std::vector<std::string> out;
    std::set<size_t> seen;
    for (const auto& a : m_anomalies) {
        if (a.catalog_date != catalog_date) continue;
        if (seen.insert(a.line).second) out.push_back(a.raw);
    }
    return out;
}

const std::vector<std::string>& CourseIndexAggregator::raw_rows(const std::string& catalog_date) const {
    static const std::vector<std::string> empty;
    auto it = m_raw_rows.find(catalog_date);
    if (it == m_raw_rows.end()) return empty;
    return it->second;
}

}  // namespace catalog
