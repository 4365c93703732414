// src/data/csv_reader.cpp

#include "cross_stats/data/csv_reader.hpp"
#include <fstream>

namespace cross_stats {

namespace {

void skip_bom(std::istream& input) {
    static const int kBom[] = {0xEF, 0xBB, 0xBF};
    int matched = 0;
    for (int expected : kBom) {
        if (input.peek() != expected) {
            break;
        }
        input.get();
        ++matched;
    }
    if (matched == 3) {
        return;
    }
    input.clear(input.rdstate() & ~std::ios::eofbit);
    while (matched-- > 0) {
        input.unget();
    }
}

}  // namespace

CsvReader::CsvReader(char delimiter) : delimiter_(delimiter) {}

bool CsvReader::read_record(std::istream& input, RawRecord& record) const {
    record.clear();
    if (input.peek() == std::char_traits<char>::eof()) {
        return false;
    }

    std::string field;
    bool in_quotes = false;
    bool saw_content = false;
    char c;

    while (input.get(c)) {
        if (in_quotes) {
            if (c == '"') {
                if (input.peek() == '"') {
                    input.get();
                    field += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            saw_content = true;
        } else if (c == delimiter_) {
            record.push_back(std::move(field));
            field.clear();
            saw_content = true;
        } else if (c == '\r') {
            if (input.peek() == '\n') {
                input.get();
            }
            break;
        } else if (c == '\n') {
            break;
        } else {
            field += c;
            saw_content = true;
        }
    }

    // A blank line yields an empty record
    if (saw_content || !field.empty()) {
        record.push_back(std::move(field));
    }
    return true;
}

Result<std::vector<RawRecord>> CsvReader::read_stream(std::istream& input) const {
    std::vector<RawRecord> records;
    skip_bom(input);

    RawRecord record;
    while (read_record(input, record)) {
        records.push_back(record);
    }

    if (input.bad()) {
        return make_error<std::vector<RawRecord>>(ErrorCode::FILE_IO_ERROR,
                                                  "Stream error while reading records",
                                                  "CsvReader");
    }
    return Result<std::vector<RawRecord>>(std::move(records));
}

Result<std::vector<RawRecord>> CsvReader::read_file(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_error<std::vector<RawRecord>>(ErrorCode::FILE_NOT_FOUND,
                                                  "Could not open file: " + path, "CsvReader");
    }

    auto records = read_stream(file);
    if (records.is_error()) {
        return make_error<std::vector<RawRecord>>(
            records.error()->code(), std::string(records.error()->what()) + ": " + path,
            "CsvReader");
    }
    return records;
}

}  // namespace cross_stats
