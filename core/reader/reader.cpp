#include "reader/reader.hpp"
#include "util/log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace puzlib {

std::string contents(const std::string& source) {
    std::error_code ec;
    std::filesystem::path path(source);
    if (source.find('\n') != std::string::npos || !std::filesystem::is_regular_file(path, ec)) {
        return source;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open file: " + source);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("Failed to read file: " + source);
    }

    std::string text = buffer.str();
    logging::get()->debug("reader: loaded {} bytes from {}", text.size(), source);
    return text;
}

// ─── Text helpers ──────────────────────────────────────────────

std::vector<std::string> lines(std::string_view text) {
    std::vector<std::string> result;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        result.emplace_back(line);
        start = end + 1;
    }
    return result;
}

std::vector<std::string> split(std::string_view text, std::string_view sep) {
    if (sep.empty()) {
        throw std::invalid_argument("split: empty separator");
    }
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + sep.size();
    }
    return parts;
}

std::vector<std::string> splitRecords(std::string_view text) {
    std::vector<std::string> records;
    std::string current;
    for (const auto& line : lines(text)) {
        if (line.empty()) {
            if (!current.empty()) records.push_back(std::move(current));
            current.clear();
            continue;
        }
        if (!current.empty()) current += '\n';
        current += line;
    }
    if (!current.empty()) records.push_back(std::move(current));
    return records;
}

std::string trim(std::string_view text) {
    const char* whitespace = " \t\r\n\v\f";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    size_t last = text.find_last_not_of(whitespace);
    return std::string(text.substr(first, last - first + 1));
}

// ─── Readers ───────────────────────────────────────────────────

std::vector<std::string> readLines(const std::string& source) {
    std::vector<std::string> result;
    for (auto& line : lines(contents(source))) {
        if (!line.empty()) result.push_back(std::move(line));
    }
    return result;
}

std::vector<std::string> readStringRecords(const std::string& source) {
    return splitRecords(contents(source));
}

std::vector<char> readLine(const std::string& source) {
    std::vector<char> chars;
    for (char c : contents(source)) {
        if (c != '\n' && c != '\r') chars.push_back(c);
    }
    return chars;
}

std::vector<std::string> readLineSep(const std::string& source, const std::string& sep) {
    return split(trim(contents(source)), sep);
}

std::vector<std::string> readGrid(const std::string& source) {
    return lines(trim(contents(source)));
}

std::vector<std::vector<uint8_t>> readGridNumbers(const std::string& source) {
    std::vector<std::vector<uint8_t>> grid;
    for (const auto& line : lines(contents(source))) {
        std::vector<uint8_t> row;
        row.reserve(line.size());
        for (char c : line) {
            if (c < '0' || c > '9') {
                throw std::runtime_error(std::string("Not a digit in grid: '") + c + "'");
            }
            row.push_back(static_cast<uint8_t>(c - '0'));
        }
        grid.push_back(std::move(row));
    }
    return grid;
}

std::vector<std::pair<Vec2D<size_t>, char>> readGridToMap(const std::string& source) {
    std::vector<std::pair<Vec2D<size_t>, char>> cells;
    auto rows = lines(contents(source));
    for (size_t row = 0; row < rows.size(); row++) {
        for (size_t col = 0; col < rows[row].size(); col++) {
            cells.emplace_back(Vec2D<size_t>(row, col), rows[row][col]);
        }
    }
    return cells;
}

std::vector<std::vector<std::string>> readGridRecords(const std::string& source) {
    std::vector<std::vector<std::string>> grids;
    for (const auto& record : splitRecords(contents(source))) {
        grids.push_back(lines(record));
    }
    return grids;
}

} // namespace puzlib
