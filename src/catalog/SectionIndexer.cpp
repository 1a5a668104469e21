#include "catalog/SectionIndexer.hpp"
#include "catalog/Anchors.hpp"
#include "catalog/TextUtil.hpp"

#include <algorithm>

namespace catalog {

// ---------- SectionsIndex ----------

const DateSections* SectionsIndex::find_date(const std::string& date) const {
    for (const auto& d : m_dates) {
        if (d.catalog_date == date) return &d;
    }
    return nullptr;
}

const Section* SectionsIndex::find(const std::string& date, const std::string& college, const std::string& degree) const {
    const DateSections* d = find_date(date);
    if (!d) return nullptr;
    for (const auto& c : d->colleges) {
        if (c.college != college) continue;
        for (const auto& ds : c.degrees) {
            if (ds.degree == degree) return &ds.span;
        }
    }
    return nullptr;
}

size_t SectionsIndex::section_count() const {
    size_t n = 0;
    for (const auto& d : m_dates)
        for (const auto& c : d.colleges) n += c.degrees.size();
    return n;
}

DateSections& SectionsIndex::ensure_date(const std::string& date) {
    for (auto& d : m_dates) {
        if (d.catalog_date == date) return d;
    }
    m_dates.push_back({date, {}});
    return m_dates.back();
}

CollegeSections& SectionsIndex::ensure_college(const std::string& date, const std::string& college) {
    DateSections& d = ensure_date(date);
    for (auto& c : d.colleges) {
        if (c.college == college) return c;
    }
    d.colleges.push_back({college, {}});
    return d.colleges.back();
}

void SectionsIndex::insert(const std::string& date, const std::string& college, const std::string& degree, Section s) {
    CollegeSections& c = ensure_college(date, college);
    for (auto& ds : c.degrees) {
        if (ds.degree == degree) {
            ds.span = s;
            return;
        }
    }
    c.degrees.push_back({degree, s});
}

// ---------- StopFence ----------

const char* stop_fence_str(StopFence f) {
    switch (f) {
        case StopFence::SiblingOrCollege: return "sibling_or_college";
        case StopFence::SiblingOnly: return "sibling_only";
    }
    return "unknown";
}

bool parse_stop_fence(const std::string& s, StopFence& out) {
    if (s == "sibling_or_college") { out = StopFence::SiblingOrCollege; return true; }
    if (s == "sibling_only") { out = StopFence::SiblingOnly; return true; }
    return false;
}

// ---------- SectionIndexer ----------

static bool contains_str(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

IndexReport SectionIndexer::index_headings(const CatalogDocument& doc, const ProgramNames& programs) {
    IndexReport rep;
    const std::string& date = doc.catalog_date();
    m_index.ensure_date(date);

    for (const auto& cp : programs.colleges()) {
        m_index.ensure_college(date, cp.college);

        for (const auto& degree : cp.degrees) {
            auto fail = [&](const std::string& msg) {
                rep.failures.push_back({date, cp.college, degree, ErrorKind::MissingSectionAnchor, msg});
            };

            auto heading = doc.find_line(degree);
            if (!heading) {
                fail("heading not found: " + degree);
                continue;
            }

            auto start = doc.find_ccn_header(*heading);
            if (!start) {
                fail("CCN header not found after heading: " + degree);
                continue;
            }

            size_t stop = doc.size();
            for (size_t k = *start + 1; k < doc.size(); ++k) {
                const std::string& nl = doc.line(k);
                if (nl != degree && contains_str(cp.degrees, nl)) { stop = k; break; }
                if (m_fence == StopFence::SiblingOrCollege && programs.has_college(nl)) { stop = k; break; }
                if (anchors::is_footer(nl)) { stop = k; break; }
            }

            m_index.insert(date, cp.college, degree, Section{*start, stop});
            rep.found++;
        }
    }

    return rep;
}

// canonical college named by `line`: an exact entry, else the first entry the line starts with
static std::string match_valid_college(const std::string& line, const std::vector<std::string>& valid_colleges) {
    if (contains_str(valid_colleges, line)) return line;
    for (const auto& vc : valid_colleges) {
        if (!vc.empty() && textutil::starts_with(line, vc)) return vc;
    }
    return "";
}

FallbackSection SectionIndexer::index_upward_scan(const CatalogDocument& doc, const std::vector<std::string>& valid_colleges) {
    const std::string& date = doc.catalog_date();

    auto first_ccn = doc.find_ccn_header();
    if (!first_ccn) throw MissingSectionAnchor("no CCN header in catalog " + date);

    // walk upward to the enclosing college
    std::string college;
    size_t college_idx = 0;
    for (size_t j = *first_ccn; j-- > 0;) {
        college = match_valid_college(doc.line(j), valid_colleges);
        if (!college.empty()) {
            college_idx = j;
            break;
        }
    }
    if (college.empty()) throw NoEnclosingCollege("no valid college above first CCN header in catalog " + date);

    // best guess: first non-empty line between the college and the CCN header that is not
    // itself a college heading
    std::string degree;
    for (size_t i = college_idx + 1; i < *first_ccn; ++i) {
        const std::string& line = doc.line(i);
        if (!line.empty() && !anchors::is_college_heading(line)) {
            degree = line;
            break;
        }
    }
    if (degree.empty()) throw MissingSectionAnchor("no degree heading between " + college + " and the first CCN header in catalog " + date);

    const size_t start = *first_ccn;
    size_t stop = doc.size();
    for (size_t k = start + 1; k < doc.size(); ++k) {
        const std::string& line = doc.line(k);
        if (anchors::is_college_heading(line) || anchors::is_footer(line) ||
            !match_valid_college(line, valid_colleges).empty()) {
            stop = k;
            break;
        }
    }

    FallbackSection fs{college, degree, Section{start, stop}};
    m_index.insert(date, college, degree, fs.span);
    return fs;
}

}  // namespace catalog
