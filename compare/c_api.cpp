#include "c_api.hpp"
#include "comparison.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <new>
#include <span>
#include <string>

namespace {

std::span<const double> as_span(const double* data, size_t n, const char* name) {
    if (data == nullptr && n > 0) {
        throw funnel::InputError(std::string(name) + " is null");
    }
    return std::span<const double>(data, n);
}

}  // namespace

extern "C" int funnel_compare_and_report(const double* x_reference, const double* y_reference,
                                         size_t n_reference,
                                         const double* x_test, const double* y_test,
                                         size_t n_test,
                                         const char* output_directory,
                                         double atolx, double atoly,
                                         double rtolx, double rtoly) {
    auto log = funnel::logging::get_logger();

    try {
        if (output_directory == nullptr) {
            throw funnel::ConfigurationError("output directory is null");
        }

        funnel::Tolerances tol{.atolx = atolx, .atoly = atoly, .rtolx = rtolx, .rtoly = rtoly};
        bool passed = funnel::compare_and_report(
            as_span(x_reference, n_reference, "reference x"),
            as_span(y_reference, n_reference, "reference y"),
            as_span(x_test, n_test, "test x"),
            as_span(y_test, n_test, "test y"),
            tol, output_directory);

        log->debug("funnel_compare_and_report: wrote {} ({})", output_directory,
                   passed ? "inside the tube" : "outliers found");
        return 0;

    } catch (const std::bad_alloc&) {
        log->error("funnel_compare_and_report: out of memory");
        return 1;
    } catch (const std::exception& e) {
        log->error("funnel_compare_and_report: {}", e.what());
        return 1;
    }
}

extern "C" int funnel_set_log_level(const char* name) {
    if (name == nullptr || !funnel::logging::set_level(name)) {
        return 1;
    }
    return 0;
}
