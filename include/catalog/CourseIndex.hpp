#pragma once
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "catalog/CatalogDocument.hpp"
#include "catalog/CourseRowClassifier.hpp"
#include "catalog/SectionIndexer.hpp"

namespace catalog {

struct CourseInstance {
    std::string catalog_date;
    std::string college;
    std::string degree;
    PatternId pattern = PatternId::CcnFull;
    std::string raw;
};

struct CourseIndexEntry {
    std::string code;
    // taken from the first instance in scan order and never overwritten
    std::string canonical_title;
    int canonical_credit_units = 0;
    std::vector<CourseInstance> instances;
};

// course code -> entry, in first-seen order. Only CourseIndexAggregator mutates it.
class CourseIndex {
public:
    const std::vector<CourseIndexEntry>& entries() const { return m_entries; }
    const CourseIndexEntry* find(const std::string& code) const;
    size_t size() const { return m_entries.size(); }

private:
    friend class CourseIndexAggregator;

    CourseIndexEntry& upsert(const std::string& code, const std::string& title, int credit_units);

    std::vector<CourseIndexEntry> m_entries;
    std::unordered_map<std::string, size_t> m_pos;
};

enum class AnomalyReason {
    Unmatched,  // no row shape matched
    NoCode      // only the FALLBACK shape matched, nothing to key the index on
};

const char* anomaly_reason_str(AnomalyReason r);

struct Anomaly {
    std::string catalog_date;
    std::string college;
    std::string degree;
    std::string raw;
    AnomalyReason reason = AnomalyReason::Unmatched;
    size_t line = 0;  // index into the catalog document
};

struct SectionScanStats {
    int rows = 0;
    int indexed = 0;
    int anomalies = 0;
};

class CourseIndexAggregator {
public:
    // Scans [start_line + 1, stop_line). A CCN header opens a new block, a footer closes the
    // current one; every non-empty line inside a block is classified.
    SectionScanStats add_section(const CatalogDocument& doc,
                                 const std::string& college,
                                 const std::string& degree,
                                 const Section& section);

    // every section of one date, in index order
    SectionScanStats add_date(const CatalogDocument& doc, const DateSections& sections);

    const CourseIndex& index() const { return m_index; }
    const std::vector<Anomaly>& anomalies() const { return m_anomalies; }

    // Per-date views, one entry per document line even when sections overlap
    // (degrees listed together usually share the first CCN block).
    std::vector<std::string> anomaly_lines(const std::string& catalog_date) const;
    const std::vector<std::string>& raw_rows(const std::string& catalog_date) const;

private:
    CourseIndex m_index;
    std::vector<Anomaly> m_anomalies;
    std::map<std::string, std::vector<std::string>> m_raw_rows;
    std::map<std::string, std::set<size_t>> m_raw_row_lines;  // date -> lines already in m_raw_rows
};

}  // namespace catalog
