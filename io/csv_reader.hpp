#ifndef FUNNEL_IO_CSV_READER_HPP
#define FUNNEL_IO_CSV_READER_HPP

#include <curve/data_set.hpp>
#include <cstddef>
#include <string>
#include <string_view>

namespace funnel::io {

struct CsvOptions {
    // Header lines ignored before the first sample
    size_t skip_lines = 1;
};

// Parse two-column text, columns separated by ',' or ';'.
// Blank lines are ignored. Reading stops at the first line that is not a
// pair of numbers; the samples read so far are returned.
DataSet parse_csv(std::string_view content, const CsvOptions& options = CsvOptions{});

// Read and parse a file; throws std::runtime_error if it cannot be opened
DataSet read_csv(const std::string& path, const CsvOptions& options = CsvOptions{});

}  // namespace funnel::io

#endif // FUNNEL_IO_CSV_READER_HPP
