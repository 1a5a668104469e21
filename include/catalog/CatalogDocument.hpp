#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace catalog {

// One catalog text dump. Lines are trimmed; blank lines are kept so indices match the file.
class CatalogDocument {
public:
    // Throws UnreadableCatalog when the file cannot be opened.
    static CatalogDocument load(const std::filesystem::path& path);
    static CatalogDocument from_lines(std::string catalog_date, std::vector<std::string> lines);

    const std::string& catalog_date() const { return m_date; }
    const std::vector<std::string>& lines() const { return m_lines; }
    size_t size() const { return m_lines.size(); }
    const std::string& line(size_t i) const { return m_lines.at(i); }

    // index of the first CCN header at or after `from`
    std::optional<size_t> find_ccn_header(size_t from = 0) const;

    // index of the first line equal to `text`
    std::optional<size_t> find_line(const std::string& text) const;

private:
    std::string m_date;
    std::vector<std::string> m_lines;
};

// "catalog_2018_07.txt" -> "2018-07"; nullopt for any other name
std::optional<std::string> catalog_date_from_filename(const std::string& filename);

// "2018-07" -> "2018_07", used for per-date artifact names
std::string date_file_stem(const std::string& catalog_date);

// *.txt files under dir, sorted by filename (names are not checked here)
std::vector<std::filesystem::path> list_catalog_files(const std::filesystem::path& dir);

}  // namespace catalog
