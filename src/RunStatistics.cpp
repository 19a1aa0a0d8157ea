#include "RunStatistics.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <numeric>

namespace ams {

StatSummary summarize(const std::vector<double>& values) {
    StatSummary result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

RunTableSummary summarizeRuns(const RunTable& table) {
    std::vector<double> probability;
    std::vector<double> iterations;
    std::vector<double> transitions;
    std::vector<double> runtime;
    probability.reserve(table.rows.size());
    iterations.reserve(table.rows.size());
    transitions.reserve(table.rows.size());
    runtime.reserve(table.rows.size());

    for (const auto& row : table.rows) {
        probability.push_back(row.probability);
        iterations.push_back(static_cast<double>(row.iterations));
        transitions.push_back(static_cast<double>(row.transitions));
        runtime.push_back(row.runtime_s);
    }

    RunTableSummary summary{};
    summary.runs = table.rows.size();
    summary.failed_runs = table.failed_runs;
    summary.probability = summarize(probability);
    summary.iterations = summarize(iterations);
    summary.transitions = summarize(transitions);
    summary.runtime_s = summarize(runtime);
    return summary;
}

bool exportRunTableCSV(const RunTable& table, const std::string& filename) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "run,probability,iterations,transitions,runtime_s\n";
    std::size_t i = 0;
    for (const auto& row : table.rows) {
        out << i++ << ','
            << std::setprecision(12) << row.probability << ','
            << row.iterations << ','
            << row.transitions << ','
            << std::fixed << std::setprecision(6) << row.runtime_s << '\n'
            << std::defaultfloat;
    }
    return static_cast<bool>(out);
}

bool exportEnsembleCSV(const AmsResult& result, const std::string& filename) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    const TrajectoryBatch& traj = result.trajectories;
    out << "trajectory,step,score";
    for (std::size_t d = 0; d < traj.dim; ++d) {
        out << ",c" << d;
    }
    out << '\n';

    out << std::setprecision(12);
    for (std::size_t i = 0; i < traj.count; ++i) {
        const std::size_t n = (i < result.lengths.size()) ? result.lengths[i] : traj.naturalLength(i);
        for (std::size_t t = 0; t < n; ++t) {
            out << i << ',' << t << ',' << result.scores.at(i, t);
            for (std::size_t d = 0; d < traj.dim; ++d) {
                out << ',' << traj.at(i, t, d);
            }
            out << '\n';
        }
    }
    return static_cast<bool>(out);
}

} // namespace ams
