#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "AmsErrors.h"
#include "AmsTypes.h"
#include "RandomStream.h"

namespace ams {

// Extends `count` paths from the given initial states. Output steps may vary
// per call; dimension must match the configured state dimension. Each path's
// first step is its initial state.
using TrajectoryGenerator = std::function<TrajectoryBatch(std::size_t count, const StateBatch& init)>;

// One progress value per trajectory per step. Undefined steps stay undefined.
using ScoreFunction = std::function<ScoreBatch(const TrajectoryBatch& trajectories)>;

using RegionTest = std::function<RegionMask(const TrajectoryBatch& trajectories)>;

// Start region (A) and target region (B). A step is never in both.
struct RegionClassifier {
    RegionTest is_start;
    RegionTest is_target;
};

enum class FailurePolicy : int {
    Abort = 0, // first failing run propagates its exception
    Skip  = 1, // failing runs are logged, counted and left out of the table
};

struct AmsConfig {
    std::size_t ensemble_size = 10;        // N
    std::size_t survivors_per_level = 1;   // nc, 1 <= nc < N
    std::size_t state_dimension = 2;       // D, time is the last component by convention
    std::uint64_t seed = 0u;

    // 0 = unbounded. The loop has no other exit besides level convergence.
    std::size_t max_iterations = 0;

    FailurePolicy failure_policy = FailurePolicy::Abort;

    TrajectoryGenerator generator;
    ScoreFunction score;
    RegionClassifier regions;
};

struct IterationRecord {
    std::size_t iteration = 0;       // 0-based
    std::size_t distinct_levels = 0; // before selection
    double level_threshold = 0.0;
    std::size_t discarded = 0;
    double weight = 1.0;             // after this iteration's update
};

struct AmsResult {
    double probability = 0.0;
    std::size_t iterations = 0;
    std::size_t transitions = 0;     // trajectories with Q >= collapse threshold

    TrajectoryBatch trajectories;    // padded with kUndefined
    ScoreBatch scores;               // padded with kUndefined
    std::vector<std::size_t> lengths;
    std::vector<double> levels;      // final Q per slot

    double weight = 1.0;
    std::vector<IterationRecord> history;
    bool converged = true;           // false only if max_iterations stopped the loop
    double runtime_s = 0.0;
};

struct RunRecord {
    double probability = 0.0;
    std::size_t iterations = 0;
    std::size_t transitions = 0;
    double runtime_s = 0.0;
};

struct RunTable {
    std::vector<RunRecord> rows;
    std::size_t failed_runs = 0;
};

class AmsEstimator {
public:
    // Throws ConfigurationError if nc is outside [1, N), D is zero or a
    // collaborator is missing.
    explicit AmsEstimator(const AmsConfig& config);

    const AmsConfig& config() const { return config_; }

    // Adaptive multilevel splitting from N initial states.
    //
    // Each iteration takes the nc-th smallest distinct level as threshold and
    // regenerates every trajectory whose level is <= threshold. Ties at the
    // threshold are all discarded, so one iteration may remove more than nc
    // slots and the survivors are exactly those strictly above it. The loop
    // ends once at most nc distinct levels remain.
    //
    // Throws ConfigurationError for a bad initial batch, ContractViolation
    // for malformed collaborator output and DegenerateTrajectoryError for a
    // trajectory without any defined step. Nothing is returned on failure.
    AmsResult run(const StateBatch& initial_states, double collapse_threshold = 1.0);

    // `count` sequential runs from the same initial states. The random stream
    // is not reseeded between runs.
    RunTable runMultiple(std::size_t count, const StateBatch& initial_states, double collapse_threshold = 1.0);

    void resetSeed(std::uint64_t seed) { rng_.reseed(seed); }
    RandomStream& randomStream() { return rng_; }
    const RandomStream& randomStream() const { return rng_; }

private:
    AmsConfig config_;
    RandomStream rng_;

    TrajectoryBatch generate(std::size_t count, const StateBatch& init) const;
    ScoreBatch scoreOf(const TrajectoryBatch& trajectories) const;
    void applyRegionOverride(const TrajectoryBatch& trajectories,
                             ScoreBatch& scores,
                             const std::vector<std::size_t>& lengths) const;
    std::vector<double> levelsOf(const ScoreBatch& scores, const std::vector<std::size_t>& lengths) const;
};

// Number of distinct values, exact equality.
std::size_t countDistinct(const std::vector<double>& values);

} // namespace ams
