#pragma once

#include <string>
#include <vector>

#include "AmsEstimator.h"

namespace ams {

struct StatSummary {
    double mean = 0.0;
    double median = 0.0;
    double ci_lower_95 = 0.0;
    double ci_upper_95 = 0.0;
    double std_dev = 0.0;
};

struct RunTableSummary {
    std::size_t runs = 0;
    std::size_t failed_runs = 0;
    StatSummary probability{};
    StatSummary iterations{};
    StatSummary transitions{};
    StatSummary runtime_s{};
};

// Percentiles are linearly interpolated; std_dev is the population value.
// Empty input gives a zeroed summary.
StatSummary summarize(const std::vector<double>& values);

RunTableSummary summarizeRuns(const RunTable& table);

// Columns: run,probability,iterations,transitions,runtime_s
bool exportRunTableCSV(const RunTable& table, const std::string& filename);

// Long format over defined steps: trajectory,step,score,c0..c{D-1}
bool exportEnsembleCSV(const AmsResult& result, const std::string& filename);

} // namespace ams
