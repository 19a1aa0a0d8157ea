#pragma once

// models/double_well.h
//
// One-dimensional double-well test model for the AMS estimator.
//
// Dynamics (overdamped Langevin, Euler-Maruyama):
//   dx = (x - x^3) dt + sqrt(2 mu) dW
// Wells sit at x = -1 and x = +1 with a barrier at x = 0.
//
// State layout: [x, t]. Time is absolute, so a clone restarted at time t0
// only has t_max - t0 left to reach the target.
//
// Regions:
//   start  A: x <= x_start
//   target B: x >= x_target
//
// A path ends at the first step that enters B, at the first step back in A
// once it has been outside A, or when t reaches t_max. The ending step is
// always stored; the rest of the row is padded with ams::kUndefined.

#include <cstddef>
#include <cstdint>

#include "AmsEstimator.h"
#include "RandomStream.h"

namespace ams {
namespace models {

struct DoubleWellConfig {
    double mu = 0.03;        // noise amplitude
    double dt = 0.01;        // integration step
    double t_max = 50.0;     // absolute horizon
    double x_start = -1.0;
    double x_target = 1.0;

    // Store every k-th integration step (ending step is always kept).
    std::size_t sample_stride = 1;
    std::uint64_t seed = 0u;
};

class DoubleWellModel {
public:
    static constexpr std::size_t kDimension = 2;

    DoubleWellModel() = default;
    // Throws std::invalid_argument for non-positive dt, mu < 0, t_max <= 0,
    // x_target <= x_start or a zero sample stride.
    explicit DoubleWellModel(const DoubleWellConfig& cfg);

    const DoubleWellConfig& config() const { return cfg_; }
    RandomStream& randomStream() { return rng_; }

    // Trajectory generator. init must have dimension 2.
    TrajectoryBatch trajectories(std::size_t count, const StateBatch& init);

    // (x - x_start) / (x_target - x_start); undefined steps stay undefined.
    ScoreBatch scoreCoordinate(const TrajectoryBatch& traj) const;

    RegionMask isStart(const TrajectoryBatch& traj) const;
    RegionMask isTarget(const TrajectoryBatch& traj) const;

    // Wires generator, score and regions into cfg. The model must outlive
    // any estimator built from cfg.
    void attachTo(AmsConfig& cfg);

private:
    DoubleWellConfig cfg_{};
    RandomStream rng_{};

    static void validate(const DoubleWellConfig& cfg);
};

} // namespace models
} // namespace ams
