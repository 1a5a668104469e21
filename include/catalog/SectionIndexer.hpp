#pragma once
#include <string>
#include <utility>
#include <vector>

#include "catalog/CatalogDocument.hpp"
#include "catalog/Errors.hpp"
#include "catalog/ProgramNames.hpp"

namespace catalog {

// Half-open line interval [start_line, stop_line) into a CatalogDocument.
// start_line is the CCN header that opens the degree's course listing.
struct Section {
    size_t start_line = 0;
    size_t stop_line = 0;
};

struct DegreeSection {
    std::string degree;
    Section span;
};

struct CollegeSections {
    std::string college;
    std::vector<DegreeSection> degrees;
};

struct DateSections {
    std::string catalog_date;
    std::vector<CollegeSections> colleges;
};

// date -> college -> degree -> Section, in insertion order.
// Read-only to everyone but SectionIndexer.
class SectionsIndex {
public:
    const std::vector<DateSections>& dates() const { return m_dates; }

    const DateSections* find_date(const std::string& date) const;
    const Section* find(const std::string& date, const std::string& college, const std::string& degree) const;

    size_t section_count() const;

private:
    friend class SectionIndexer;

    DateSections& ensure_date(const std::string& date);
    CollegeSections& ensure_college(const std::string& date, const std::string& college);
    void insert(const std::string& date, const std::string& college, const std::string& degree, Section s);

    std::vector<DateSections> m_dates;
};

// Which lines end a degree section besides footers.
//  SiblingOrCollege: another degree of the same college, or any college key of the listing.
//  SiblingOnly:      another degree of the same college only.
enum class StopFence {
    SiblingOrCollege,
    SiblingOnly
};

const char* stop_fence_str(StopFence f);
bool parse_stop_fence(const std::string& s, StopFence& out);

struct SectionFailure {
    std::string catalog_date;
    std::string college;
    std::string degree;
    ErrorKind kind = ErrorKind::MissingSectionAnchor;
    std::string message;
};

struct FallbackSection {
    std::string college;  // canonical name from the valid-college list
    std::string degree;
    Section span;
};

struct IndexReport {
    int found = 0;
    std::vector<SectionFailure> failures;
};

class SectionIndexer {
public:
    explicit SectionIndexer(StopFence fence = StopFence::SiblingOrCollege) : m_fence(fence) {}

    // Heading-driven: one section per listed (college, degree). Degrees whose heading or
    // CCN header cannot be found are reported and skipped.
    IndexReport index_headings(const CatalogDocument& doc, const ProgramNames& programs);

    // Fallback for catalogs without a program listing: the college enclosing the first
    // CCN header, and a single best-guess degree under it.
    // Throws NoEnclosingCollege or MissingSectionAnchor; nothing is inserted in that case.
    FallbackSection index_upward_scan(const CatalogDocument& doc, const std::vector<std::string>& valid_colleges);

    const SectionsIndex& index() const { return m_index; }
    SectionsIndex release() { return std::move(m_index); }

private:
    StopFence m_fence;
    SectionsIndex m_index;
};

}  // namespace catalog
