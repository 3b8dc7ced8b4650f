#include "csv_report_writer.hpp"
#include "text_file.hpp"
#include <common/logging.hpp>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace funnel::io {

std::string to_csv(const DataSet& data) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);

    ss << "x,y\n";
    for (const auto& p : data.points()) {
        ss << p.x << "," << p.y << "\n";
    }
    return ss.str();
}

CsvReportWriter::CsvReportWriter(std::string output_directory)
    : output_directory_(std::move(output_directory)) {}

void CsvReportWriter::write(const ComparisonResult& result) {
    auto log = funnel::logging::get_logger();

    if (output_directory_.empty()) {
        throw std::runtime_error("No output directory given");
    }

    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " +
                                 output_directory_ + ": " + ec.message());
    }

    write_curve(REFERENCE_FILE, result.reference);
    write_curve(LOWER_BOUND_FILE, result.lower);
    write_curve(UPPER_BOUND_FILE, result.upper);
    write_curve(TEST_FILE, result.test);
    write_curve(ERRORS_FILE, result.errors.diff);

    log->debug("Wrote report files to {}", output_directory_);
}

void CsvReportWriter::write_curve(const char* file_name, const DataSet& data) const {
    std::filesystem::path path = std::filesystem::path(output_directory_) / file_name;
    write_file(path.string(), to_csv(data));
}

}  // namespace funnel::io
