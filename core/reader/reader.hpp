#pragma once

#include "measure/vec2d.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace puzlib {

// ─── Input Reader ──────────────────────────────────────────────
// Every reader takes either a path or the puzzle text itself: if the
// argument names an existing file its contents are used, otherwise the
// argument is treated as the text. This lets tests pass examples inline.
//
// Unreadable files and unparseable numbers throw std::runtime_error.

/// File contents if source names an existing file, otherwise source.
std::string contents(const std::string& source);

// ── Text helpers ──

/// Split text into lines. "\r\n" endings are accepted and a trailing
/// newline does not produce an empty last line.
std::vector<std::string> lines(std::string_view text);

/// Split on every occurrence of sep (non-empty).
std::vector<std::string> split(std::string_view text, std::string_view sep);

/// Split on blank lines, dropping empty records.
std::vector<std::string> splitRecords(std::string_view text);

std::string trim(std::string_view text);

/// Parse a whole token (surrounding whitespace ignored) as a number.
template <typename T>
T parseNumber(std::string_view token) {
    static_assert(std::is_arithmetic_v<T>, "parseNumber requires an arithmetic type");
    std::string cleaned = trim(token);
    auto fail = [&]() -> T {
        throw std::runtime_error("Could not parse number: '" + std::string(token) + "'");
    };
    if (cleaned.empty()) return fail();

    if constexpr (std::is_integral_v<T>) {
        const char* first = cleaned.data();
        const char* last = cleaned.data() + cleaned.size();
        if (*first == '+') {
            first++;
            if (first == last || *first == '-') return fail();
        }
        T value{};
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) return fail();
        return value;
    } else {
        char* end = nullptr;
        long double value = std::strtold(cleaned.c_str(), &end);
        if (end != cleaned.c_str() + cleaned.size()) return fail();
        return static_cast<T>(value);
    }
}

// ── Line based ──

/// Non-empty lines.
std::vector<std::string> readLines(const std::string& source);

/// One number per non-empty line.
template <typename T>
std::vector<T> readNumbers(const std::string& source) {
    std::vector<T> numbers;
    for (const auto& line : readLines(source)) {
        numbers.push_back(parseNumber<T>(line));
    }
    return numbers;
}

/// One list of numbers per non-empty line, split on sep.
template <typename T>
std::vector<std::vector<T>> readNumberLists(const std::string& source, const std::string& sep) {
    std::vector<std::vector<T>> lists;
    for (const auto& line : readLines(source)) {
        std::vector<T> row;
        for (const auto& token : split(line, sep)) {
            row.push_back(parseNumber<T>(token));
        }
        lists.push_back(std::move(row));
    }
    return lists;
}

// ── Record based ──

/// Groups of one-number-per-line records separated by blank lines.
template <typename T>
std::vector<std::vector<T>> readNumberRecords(const std::string& source) {
    std::vector<std::vector<T>> records;
    for (const auto& record : splitRecords(contents(source))) {
        std::vector<T> numbers;
        for (const auto& line : lines(record)) {
            if (line.empty()) continue;
            numbers.push_back(parseNumber<T>(line));
        }
        records.push_back(std::move(numbers));
    }
    return records;
}

/// Raw text of each blank-line separated record.
std::vector<std::string> readStringRecords(const std::string& source);

// ── Single line ──

/// Every character except line breaks.
std::vector<char> readLine(const std::string& source);

/// The trimmed text split on sep.
std::vector<std::string> readLineSep(const std::string& source, const std::string& sep);

/// The trimmed text as comma separated numbers.
template <typename T>
std::vector<T> readLineRecord(const std::string& source) {
    std::vector<T> numbers;
    for (const auto& token : readLineSep(source, ",")) {
        numbers.push_back(parseNumber<T>(token));
    }
    return numbers;
}

// ── Grids ──

/// Rows of the trimmed text.
std::vector<std::string> readGrid(const std::string& source);

/// Rows of single digits. Non-digit characters throw std::runtime_error.
std::vector<std::vector<uint8_t>> readGridNumbers(const std::string& source);

/// Every character paired with its (row, column).
std::vector<std::pair<Vec2D<size_t>, char>> readGridToMap(const std::string& source);

/// Blank-line separated grids.
std::vector<std::vector<std::string>> readGridRecords(const std::string& source);

} // namespace puzlib
