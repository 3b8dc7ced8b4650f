#ifndef FUNNEL_COMPARE_C_API_HPP
#define FUNNEL_COMPARE_C_API_HPP

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Compare the test curve against the tube around the reference curve and
// write reference.csv, lowerBound.csv, upperBound.csv, test.csv and
// errors.csv into output_directory.
//
// Returns 0 when the report was written, whether or not the test curve
// leaves the tube; errors.csv tells. Returns 1 on any failure, such as a
// missing tolerance, a bad curve, an unwritable directory or exhausted
// memory. The reason goes to the "funnel" logger. Nothing is written when
// the comparison itself fails.
int funnel_compare_and_report(const double* x_reference, const double* y_reference,
                              size_t n_reference,
                              const double* x_test, const double* y_test,
                              size_t n_test,
                              const char* output_directory,
                              double atolx, double atoly,
                              double rtolx, double rtoly);

// Set the "funnel" logger threshold by name (trace, debug, info, warn,
// error, critical, off). Returns 1 for an unknown name.
int funnel_set_log_level(const char* name);

#ifdef __cplusplus
}
#endif

#endif // FUNNEL_COMPARE_C_API_HPP
