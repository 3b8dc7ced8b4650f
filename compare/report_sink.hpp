#ifndef FUNNEL_COMPARE_REPORT_SINK_HPP
#define FUNNEL_COMPARE_REPORT_SINK_HPP

#include <curve/data_set.hpp>
#include <tube/comparator.hpp>
#include <tube/tube_size.hpp>

namespace funnel {

// Everything one comparison produces
struct ComparisonResult {
    DataSet reference;
    DataSet lower;        // Resolved lower bound
    DataSet upper;        // Resolved upper bound
    DataSet test;
    TubeSize tube;
    ErrorReport errors;

    bool passed() const { return errors.passed(); }
};

// Receives the curves of a finished comparison (files, plots, memory).
// Only called once every pipeline stage has succeeded.
class ReportSink {
public:
    virtual ~ReportSink() = default;

    virtual void write(const ComparisonResult& result) = 0;
};

}  // namespace funnel

#endif // FUNNEL_COMPARE_REPORT_SINK_HPP
