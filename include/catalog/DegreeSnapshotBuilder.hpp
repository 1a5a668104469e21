#pragma once
#include <string>
#include <utility>
#include <vector>

#include "catalog/Duplicates.hpp"
#include "catalog/ProgramNames.hpp"

namespace catalog {

extern const char* const kCertificatesCollege;  // "Certificates - Standard Paths"

struct DegreeSnapshot {
    std::string catalog_date;
    std::string snapshot_version;
    // canonical college order; degree lists sorted and unique
    std::vector<std::pair<std::string, std::vector<std::string>>> colleges;
    // colleges found in the listing that the canonical ordering does not name
    std::vector<std::string> unlisted_colleges;
};

// Throws DuplicateCertificateError when a certificate appears both under a subject college
// and in the certificates bucket, and MissingCollegeError when a canonical college
// (other than the certificates bucket) has no listing.
DegreeSnapshot build_degree_snapshot(const std::string& catalog_date,
                                     const ProgramNames& programs,
                                     const DuplicatesMap& duplicates,
                                     const std::string& snapshot_version,
                                     const std::vector<std::string>& canonical_colleges);

}  // namespace catalog
