#include "csv_reader.hpp"
#include "text_file.hpp"
#include <common/logging.hpp>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <vector>

namespace funnel::io {

namespace {

bool is_blank(std::string_view line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// "<number>[,;]+<number>" with optional surrounding whitespace
std::optional<Point2> parse_row(const std::string& line) {
    const char* cursor = line.c_str();
    char* end = nullptr;

    double x = std::strtod(cursor, &end);
    if (end == cursor) {
        return std::nullopt;
    }
    cursor = end;

    const char* separators = cursor;
    while (*cursor == ',' || *cursor == ';') {
        ++cursor;
    }
    if (cursor == separators) {
        return std::nullopt;
    }

    double y = std::strtod(cursor, &end);
    if (end == cursor) {
        return std::nullopt;
    }
    cursor = end;

    while (*cursor != '\0') {
        if (!std::isspace(static_cast<unsigned char>(*cursor))) {
            return std::nullopt;
        }
        ++cursor;
    }
    return Point2(x, y);
}

}  // namespace

DataSet parse_csv(std::string_view content, const CsvOptions& options) {
    auto log = funnel::logging::get_logger();

    std::vector<Point2> points;
    size_t line_number = 0;
    size_t pos = 0;

    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = content.size();
        }
        std::string_view line = content.substr(pos, eol - pos);
        pos = eol + 1;
        ++line_number;

        if (line_number <= options.skip_lines || is_blank(line)) {
            continue;
        }

        auto row = parse_row(std::string(line));
        if (!row) {
            log->warn("CSV: stopped at line {}, not a pair of numbers: '{}'",
                      line_number, line);
            break;
        }
        points.push_back(*row);
    }

    log->debug("CSV: read {} samples", points.size());
    return DataSet(std::move(points));
}

DataSet read_csv(const std::string& path, const CsvOptions& options) {
    auto log = funnel::logging::get_logger();
    log->debug("CSV: reading {}", path);
    return parse_csv(read_file(path), options);
}

}  // namespace funnel::io
