#include "catalog/CatalogDocument.hpp"
#include "catalog/Anchors.hpp"
#include "catalog/Errors.hpp"
#include "catalog/TextUtil.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace catalog {

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw UnreadableCatalog("failed to open: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

CatalogDocument CatalogDocument::load(const fs::path& path) {
    auto date = catalog_date_from_filename(path.filename().string());
    if (!date) throw std::runtime_error("not a catalog file name: " + path.filename().string());

    std::vector<std::string> lines = textutil::split_lines(read_all(path));
    for (auto& l : lines) l = textutil::trim(l);

    return from_lines(*date, std::move(lines));
}

CatalogDocument CatalogDocument::from_lines(std::string catalog_date, std::vector<std::string> lines) {
    CatalogDocument d;
    d.m_date = std::move(catalog_date);
    d.m_lines = std::move(lines);
    return d;
}

std::optional<size_t> CatalogDocument::find_ccn_header(size_t from) const {
    for (size_t i = from; i < m_lines.size(); ++i) {
        if (anchors::is_ccn_header(m_lines[i])) return i;
    }
    return std::nullopt;
}

std::optional<size_t> CatalogDocument::find_line(const std::string& text) const {
    auto it = std::find(m_lines.begin(), m_lines.end(), text);
    if (it == m_lines.end()) return std::nullopt;
    return static_cast<size_t>(it - m_lines.begin());
}

std::optional<std::string> catalog_date_from_filename(const std::string& filename) {
    static const std::regex re("^catalog_(\\d{4})_(\\d{2})\\.txt$");
    std::smatch m;
    if (!std::regex_match(filename, m, re)) return std::nullopt;
    return m[1].str() + "-" + m[2].str();
}

std::string date_file_stem(const std::string& catalog_date) {
    std::string s = catalog_date;
    std::replace(s.begin(), s.end(), '-', '_');
    return s;
}

std::vector<fs::path> list_catalog_files(const fs::path& dir) {
    if (!fs::exists(dir)) throw std::runtime_error("dir not found: " + dir.string());

    std::vector<fs::path> out;
    for (auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        auto p = entry.path();
        if (p.extension() != ".txt") continue;
        out.push_back(p);
    }

    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return out;
}

}  // namespace catalog
