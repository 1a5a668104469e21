#pragma once

#include <stdexcept>
#include <string>

namespace catalog {

enum class ErrorKind {
    NoApplicableSnapshot,
    MissingSectionAnchor,
    NoEnclosingCollege,
    DuplicateCertificate,
    MissingCollege,
    UnrecognizedDuplicatesFormat,
    UnreadableCatalog
};

const char* error_kind_str(ErrorKind k);

// fatal kinds abort the batch, the rest only skip a degree or a file
bool is_fatal(ErrorKind k);

class CatalogError : public std::runtime_error {
public:
    CatalogError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class NoApplicableSnapshot : public CatalogError {
public:
    explicit NoApplicableSnapshot(const std::string& date)
        : CatalogError(ErrorKind::NoApplicableSnapshot, "no snapshot version found for " + date) {}
};

class MissingSectionAnchor : public CatalogError {
public:
    explicit MissingSectionAnchor(const std::string& msg)
        : CatalogError(ErrorKind::MissingSectionAnchor, msg) {}
};

class NoEnclosingCollege : public CatalogError {
public:
    explicit NoEnclosingCollege(const std::string& msg)
        : CatalogError(ErrorKind::NoEnclosingCollege, msg) {}
};

class DuplicateCertificateError : public CatalogError {
public:
    explicit DuplicateCertificateError(const std::string& msg)
        : CatalogError(ErrorKind::DuplicateCertificate, msg) {}
};

class MissingCollegeError : public CatalogError {
public:
    explicit MissingCollegeError(const std::string& msg)
        : CatalogError(ErrorKind::MissingCollege, msg) {}
};

class UnrecognizedDuplicatesFormat : public CatalogError {
public:
    explicit UnrecognizedDuplicatesFormat(const std::string& msg)
        : CatalogError(ErrorKind::UnrecognizedDuplicatesFormat, msg) {}
};

class UnreadableCatalog : public CatalogError {
public:
    explicit UnreadableCatalog(const std::string& msg)
        : CatalogError(ErrorKind::UnreadableCatalog, msg) {}
};

}  // namespace catalog
