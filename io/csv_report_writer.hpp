#ifndef FUNNEL_IO_CSV_REPORT_WRITER_HPP
#define FUNNEL_IO_CSV_REPORT_WRITER_HPP

#include <compare/report_sink.hpp>
#include <curve/data_set.hpp>
#include <string>

namespace funnel::io {

// File names of the report, relative to the output directory
constexpr const char* REFERENCE_FILE = "reference.csv";
constexpr const char* LOWER_BOUND_FILE = "lowerBound.csv";
constexpr const char* UPPER_BOUND_FILE = "upperBound.csv";
constexpr const char* TEST_FILE = "test.csv";
constexpr const char* ERRORS_FILE = "errors.csv";

// Format a curve as "x,y" CSV with six decimals per value
std::string to_csv(const DataSet& data);

// Writes the five report files into one directory, creating it as needed
class CsvReportWriter : public ReportSink {
public:
    explicit CsvReportWriter(std::string output_directory);

    void write(const ComparisonResult& result) override;

    const std::string& output_directory() const { return output_directory_; }

private:
    void write_curve(const char* file_name, const DataSet& data) const;

    std::string output_directory_;
};

}  // namespace funnel::io

#endif // FUNNEL_IO_CSV_REPORT_WRITER_HPP
