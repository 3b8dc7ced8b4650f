#ifndef FUNNEL_COMPARE_RUN_CONFIG_HPP
#define FUNNEL_COMPARE_RUN_CONFIG_HPP

#include <io/csv_reader.hpp>
#include <tube/tolerances.hpp>

namespace funnel {

// Settings of one command-line comparison that can come from a config file
struct RunConfig {
    Tolerances tolerances;
    io::CsvOptions csv;
};

}  // namespace funnel

#endif // FUNNEL_COMPARE_RUN_CONFIG_HPP
