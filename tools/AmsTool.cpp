#include "AmsEstimator.h"
#include "Log.h"
#include "RunStatistics.h"
#include "double_well.h"

#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
void printUsage() {
    std::cout << "AmsTool usage:\n"
              << "  AmsTool [--n N] [--nc nc] [--runs k] [--mu v] [--dt v] [--t-max v] [--seed s]\n"
              << "          [--zmax v] [--max-iter k] [--skip-failures] [--out file]\n"
              << "          [--ensemble-out file] [--log-level debug|info|warn|error|off]\n";
}

std::string requireValue(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag);
    }
    return argv[++i];
}

std::size_t parseCount(const std::string& s) {
    std::size_t pos = 0;
    const unsigned long long v = std::stoull(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("Invalid integer: " + s);
    }
    return static_cast<std::size_t>(v);
}

double parseReal(const std::string& s) {
    std::size_t pos = 0;
    const double v = std::stod(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("Invalid number: " + s);
    }
    return v;
}

void printStat(const char* name, const ams::StatSummary& s) {
    std::cout << "  " << std::left << std::setw(12) << name << std::right
              << " mean=" << s.mean
              << " median=" << s.median
              << " ci95=[" << s.ci_lower_95 << ", " << s.ci_upper_95 << "]"
              << " std=" << s.std_dev << "\n";
}
} // namespace

int main(int argc, char** argv) {
    ams::AmsConfig cfg;
    ams::models::DoubleWellConfig model_cfg;
    std::size_t runs = 10;
    double zmax = 1.0;
    std::string out = "ams_runs.csv";
    std::string ensemble_out;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--n") {
                cfg.ensemble_size = parseCount(requireValue(i, argc, argv, arg));
            } else if (arg == "--nc") {
                cfg.survivors_per_level = parseCount(requireValue(i, argc, argv, arg));
            } else if (arg == "--runs") {
                runs = parseCount(requireValue(i, argc, argv, arg));
            } else if (arg == "--mu") {
                model_cfg.mu = parseReal(requireValue(i, argc, argv, arg));
            } else if (arg == "--dt") {
                model_cfg.dt = parseReal(requireValue(i, argc, argv, arg));
            } else if (arg == "--t-max") {
                model_cfg.t_max = parseReal(requireValue(i, argc, argv, arg));
            } else if (arg == "--seed") {
                const std::uint64_t seed = parseCount(requireValue(i, argc, argv, arg));
                cfg.seed = seed;
                model_cfg.seed = seed + 1u;
            } else if (arg == "--zmax") {
                zmax = parseReal(requireValue(i, argc, argv, arg));
            } else if (arg == "--max-iter") {
                cfg.max_iterations = parseCount(requireValue(i, argc, argv, arg));
            } else if (arg == "--skip-failures") {
                cfg.failure_policy = ams::FailurePolicy::Skip;
            } else if (arg == "--out") {
                out = requireValue(i, argc, argv, arg);
            } else if (arg == "--ensemble-out") {
                ensemble_out = requireValue(i, argc, argv, arg);
            } else if (arg == "--log-level") {
                const std::string name = requireValue(i, argc, argv, arg);
                ams::LogLevel level = ams::LogLevel::Warn;
                if (!ams::parseLogLevel(name, level)) {
                    throw std::runtime_error("Unknown log level: " + name);
                }
                ams::setLogLevel(level);
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "AmsTool: " << e.what() << "\n";
        printUsage();
        return 1;
    }

    try {
        ams::models::DoubleWellModel model(model_cfg);
        model.attachTo(cfg);
        ams::AmsEstimator estimator(cfg);

        const ams::StateBatch init = ams::StateBatch::tiled(cfg.ensemble_size, {model_cfg.x_start, 0.0});

        if (!ensemble_out.empty()) {
            const ams::AmsResult single = estimator.run(init, zmax);
            if (!ams::exportEnsembleCSV(single, ensemble_out)) {
                std::cerr << "AmsTool: cannot write " << ensemble_out << "\n";
                return 1;
            }
            std::cout << "Wrote ensemble of one run to: " << ensemble_out << "\n";
        }

        const ams::RunTable table = estimator.runMultiple(runs, init, zmax);

        std::cout << "run  probability    iterations  transitions  runtime_s\n";
        for (std::size_t i = 0; i < table.rows.size(); ++i) {
            const auto& row = table.rows[i];
            std::cout << std::setw(3) << i << "  "
                      << std::scientific << std::setprecision(4) << row.probability << "  "
                      << std::setw(10) << row.iterations << "  "
                      << std::setw(11) << row.transitions << "  "
                      << std::fixed << std::setprecision(4) << row.runtime_s << "\n"
                      << std::defaultfloat;
        }

        const ams::RunTableSummary summary = ams::summarizeRuns(table);
        std::cout << "Summary over " << summary.runs << " runs"
                  << " (" << summary.failed_runs << " failed):\n"
                  << std::setprecision(6);
        printStat("probability", summary.probability);
        printStat("iterations", summary.iterations);
        printStat("transitions", summary.transitions);
        printStat("runtime_s", summary.runtime_s);

        if (!ams::exportRunTableCSV(table, out)) {
            std::cerr << "AmsTool: cannot write " << out << "\n";
            return 1;
        }
        std::cout << "Wrote run table to: " << out << "\n";
    } catch (const std::exception& e) {
        std::cerr << "AmsTool: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
