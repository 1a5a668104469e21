#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace io {

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;  // each row padded/truncated to header size

    // -1 when the column is absent
    int column(const std::string& name) const;
};

// RFC 4180 style: quoted fields, doubled quotes, embedded newlines. First record is the header.
CsvTable parse_csv(const std::string& text);
CsvTable read_csv(const std::filesystem::path& path);

// quotes a field only when it contains a comma, quote or line break
std::string csv_escape(const std::string& field);

void write_csv(const std::filesystem::path& path,
               const std::vector<std::string>& header,
               const std::vector<std::vector<std::string>>& rows);

}  // namespace io
