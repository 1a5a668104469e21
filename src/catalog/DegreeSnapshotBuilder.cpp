#include "catalog/DegreeSnapshotBuilder.hpp"
#include "catalog/Errors.hpp"
#include "catalog/TextUtil.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

namespace catalog {

const char* const kCertificatesCollege = "Certificates - Standard Paths";

DegreeSnapshot build_degree_snapshot(const std::string& catalog_date,
                                     const ProgramNames& programs,
                                     const DuplicatesMap& duplicates,
                                     const std::string& snapshot_version,
                                     const std::vector<std::string>& canonical_colleges) {
    std::map<std::string, std::vector<std::string>> by_college;
    std::set<std::string> embedded_certificates;
    std::set<std::string> trailing_certificates;

    for (const auto& cp : programs.colleges()) {
        if (cp.college == kCertificatesCollege) {
            for (const auto& d : cp.degrees) trailing_certificates.insert(resolve_degree_name(d, duplicates));
            continue;
        }

        std::set<std::string> unique;
        for (const auto& d : cp.degrees) unique.insert(resolve_degree_name(d, duplicates));

        for (const auto& d : unique) {
            if (textutil::contains(d, "Certificate")) embedded_certificates.insert(d);
        }
        by_college[cp.college] = std::vector<std::string>(unique.begin(), unique.end());
    }

    if (!trailing_certificates.empty()) {
        std::vector<std::string> overlap;
        std::set_intersection(embedded_certificates.begin(), embedded_certificates.end(),
                              trailing_certificates.begin(), trailing_certificates.end(),
                              std::back_inserter(overlap));
        if (!overlap.empty()) {
            throw DuplicateCertificateError("duplicate certificates in " + catalog_date + ": " +
                                            textutil::join(overlap, "; "));
        }
    }

    DegreeSnapshot snap;
    snap.catalog_date = catalog_date;
    snap.snapshot_version = snapshot_version;

    bool certificates_placed = false;
    for (const auto& college : canonical_colleges) {
        if (college == kCertificatesCollege) {
            if (!trailing_certificates.empty()) {
                snap.colleges.emplace_back(college, std::vector<std::string>(trailing_certificates.begin(), trailing_certificates.end()));
                certificates_placed = true;
            }
            continue;
        }

        auto it = by_college.find(college);
        if (it == by_college.end()) {
            throw MissingCollegeError("missing expected college '" + college + "' in " + catalog_date +
                                      " (snapshot " + snapshot_version + ")");
        }
        snap.colleges.emplace_back(college, it->second);
    }

    if (!trailing_certificates.empty() && !certificates_placed) {
        snap.colleges.emplace_back(kCertificatesCollege, std::vector<std::string>(trailing_certificates.begin(), trailing_certificates.end()));
    }

    for (const auto& cp : programs.colleges()) {
        if (cp.college == kCertificatesCollege) continue;
        if (std::find(canonical_colleges.begin(), canonical_colleges.end(), cp.college) == canonical_colleges.end()) {
            snap.unlisted_colleges.push_back(cp.college);
        }
    }

    return snap;
}

}  // namespace catalog
