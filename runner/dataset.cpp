#include "dataset.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

// Splits content into records. A record is a list of fields; blank lines
// produce no record.
std::vector<std::vector<std::string>> read_records(const std::string& content) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;  // any char or quote seen in this record

    auto end_field = [&] {
        record.push_back(std::move(field));
        field.clear();
    };
    auto end_record = [&] {
        if (field_started || !record.empty()) {
            end_field();
            records.push_back(std::move(record));
        }
        record.clear();
        field.clear();
        field_started = false;
    };

    size_t i = 0;
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    for (; i < content.size(); ++i) {
        char c = content[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                field_started = true;
                end_field();
                break;
            case '\r':
                if (i + 1 < content.size() && content[i + 1] == '\n') ++i;
                end_record();
                break;
            case '\n':
                end_record();
                break;
            default:
                field += c;
                field_started = true;
                break;
        }
    }

    if (in_quotes) {
        throw std::runtime_error("Failed to parse CSV record " + std::to_string(records.size()) +
                                 ": unterminated quoted field");
    }
    end_record();
    return records;
}

} // namespace

std::vector<DataRow> parse_csv(const std::string& content) {
    auto records = read_records(content);
    if (records.empty()) {
        throw std::runtime_error("Failed to read CSV headers");
    }

    const auto& headers = records.front();
    std::vector<DataRow> rows;
    rows.reserve(records.size() - 1);

    for (size_t r = 1; r < records.size(); ++r) {
        const auto& record = records[r];
        if (record.size() != headers.size()) {
            throw std::runtime_error("Failed to parse CSV record " + std::to_string(r) + ": expected " +
                                     std::to_string(headers.size()) + " fields, found " +
                                     std::to_string(record.size()));
        }

        DataRow row;
        for (size_t i = 0; i < record.size(); ++i) {
            row[headers[i]] = record[i];
        }
        if (!row.empty()) rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<DataRow> load_csv_data(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.good()) {
        throw std::runtime_error("Failed to read CSV file: " + file.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_csv(buffer.str());
}
