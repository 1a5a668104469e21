#include "io/CsvIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace io {

int CsvTable::column(const std::string& name) const {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

CsvTable parse_csv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> rec;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_field = [&]() {
        rec.push_back(field);
        field.clear();
        field_started = false;
    };
    auto end_record = [&]() {
        end_field();
        // skip blank lines
        if (!(rec.size() == 1 && rec[0].empty())) records.push_back(rec);
        rec.clear();
    };

    size_t i = 0;
    // UTF-8 BOM written by spreadsheet exports
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    for (; i < text.size(); ++i) {
        const char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"' && !field_started) {
            in_quotes = true;
            field_started = true;
        } else if (c == ',') {
            end_field();
        } else if (c == '\r') {
            continue;
        } else if (c == '\n') {
            end_record();
        } else {
            field.push_back(c);
            field_started = true;
        }
    }

    if (in_quotes) throw std::runtime_error("unterminated quoted CSV field");
    if (field_started || !field.empty() || !rec.empty()) end_record();

    CsvTable t;
    if (records.empty()) return t;

    t.header = records.front();
    for (size_t r = 1; r < records.size(); ++r) {
        records[r].resize(t.header.size());
        t.rows.push_back(std::move(records[r]));
    }
    return t;
}

CsvTable read_csv(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open CSV file: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_csv(ss.str());
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;

    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out += "\"";
    return out;
}

void write_csv(const fs::path& path,
               const std::vector<std::string>& header,
               const std::vector<std::vector<std::string>>& rows) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) throw std::runtime_error("failed to open output file: " + path.string());

    auto write_row = [&](const std::vector<std::string>& row) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i) out << ',';
            out << csv_escape(row[i]);
        }
        out << "\n";
    };

    write_row(header);
    for (const auto& r : rows) write_row(r);
}

}  // namespace io
