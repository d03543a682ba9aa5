/**
 * @file csv_utils.cpp
 * @brief CSV helpers implementation.
 */

#include "csv_utils.hpp"

namespace csv_utils {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n\"'");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n\"'");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split_line(const std::string& line) {
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == ',' && !in_quotes) {
            row.push_back(field);
            field.clear();
        } else {
            field += c;
        }
    }
    row.push_back(field);  // Last field
    return row;
}

std::vector<std::string> parse_header(const std::string& header_line) {
    std::vector<std::string> cols;
    for (const auto& c : split_line(header_line)) cols.push_back(trim(c));
    // Drop a UTF-8 byte order mark left on the first column
    if (!cols.empty() && cols[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
        cols[0] = cols[0].substr(3);
    }
    return cols;
}

int find_column(const std::vector<std::string>& cols, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        for (int i = 0; i < (int)cols.size(); ++i) {
            if (cols[i] == name) return i;
        }
    }
    return -1;
}

}  // namespace csv_utils
