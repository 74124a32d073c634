#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace retirecalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

void CsvReader::skip_ignorable_lines() {
    while (is_.good()) {
        int c = is_.peek();
        if (c == '#' || c == '\n' || c == '\r') {
            std::string discard;
            std::getline(is_, discard);
            ++line_number_;
            continue;
        }
        break;
    }
}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    skip_ignorable_lines();

    std::string line;
    if (!std::getline(is_, line)) {
        return row;
    }
    ++line_number_;

    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }
    return row;
}

bool CsvReader::has_more() {
    skip_ignorable_lines();
    return is_.good() && is_.peek() != std::char_traits<char>::eof();
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace retirecalc
