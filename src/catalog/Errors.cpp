#include "catalog/Errors.hpp"

namespace catalog {

const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::NoApplicableSnapshot: return "no_applicable_snapshot";
        case ErrorKind::MissingSectionAnchor: return "missing_section_anchor";
        case ErrorKind::NoEnclosingCollege: return "no_enclosing_college";
        case ErrorKind::DuplicateCertificate: return "duplicate_certificate";
        case ErrorKind::MissingCollege: return "missing_college";
        case ErrorKind::UnrecognizedDuplicatesFormat: return "unrecognized_duplicates_format";
        case ErrorKind::UnreadableCatalog: return "unreadable_catalog";
    }
    return "unknown";
}

bool is_fatal(ErrorKind k) {
    switch (k) {
        case ErrorKind::MissingSectionAnchor:
        case ErrorKind::NoEnclosingCollege:
        case ErrorKind::UnreadableCatalog:
            return false;
        case ErrorKind::NoApplicableSnapshot:
        case ErrorKind::DuplicateCertificate:
        case ErrorKind::MissingCollege:
        case ErrorKind::UnrecognizedDuplicatesFormat:
            return true;
    }
    return true;
}

}  // namespace catalog
