#include "double_well.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace ams {
namespace models {

static constexpr double kTimeEps = 1e-12;

DoubleWellModel::DoubleWellModel(const DoubleWellConfig& cfg) : cfg_(cfg), rng_(cfg.seed) {
    validate(cfg_);
}

void DoubleWellModel::validate(const DoubleWellConfig& cfg) {
    if (!(cfg.dt > 0.0) || !std::isfinite(cfg.dt)) {
        throw std::invalid_argument("DoubleWellModel: dt must be positive and finite");
    }
    if (!(cfg.mu >= 0.0) || !std::isfinite(cfg.mu)) {
        throw std::invalid_argument("DoubleWellModel: mu must be non-negative and finite");
    }
    if (!(cfg.t_max > 0.0) || !std::isfinite(cfg.t_max)) {
        throw std::invalid_argument("DoubleWellModel: t_max must be positive and finite");
    }
    if (!(cfg.x_target > cfg.x_start)) {
        throw std::invalid_argument("DoubleWellModel: x_target must lie above x_start");
    }
    if (cfg.sample_stride == 0) {
        throw std::invalid_argument("DoubleWellModel: sample_stride must be positive");
    }
}

TrajectoryBatch DoubleWellModel::trajectories(std::size_t count, const StateBatch& init) {
    if (init.dim != kDimension || init.count != count) {
        throw std::invalid_argument("DoubleWellModel: initial states must be [count x 2]");
    }

    const double noise = std::sqrt(2.0 * cfg_.mu * cfg_.dt);
    std::vector<std::vector<double>> paths(count);
    std::size_t longest = 0;

    for (std::size_t i = 0; i < count; ++i) {
        double x = init.state(i)[0];
        double t = init.state(i)[1];
        std::vector<double>& path = paths[i];
        path.push_back(x);
        path.push_back(t);

        bool left_start = x > cfg_.x_start;
        bool done = x >= cfg_.x_target || t >= cfg_.t_max - kTimeEps;
        std::size_t step = 0;

        while (!done) {
            x += (x - x * x * x) * cfg_.dt + noise * rng_.normal();
            t += cfg_.dt;
            ++step;

            if (x >= cfg_.x_target) {
                done = true;
            } else if (x <= cfg_.x_start) {
                done = left_start;
            } else {
                left_start = true;
            }
            if (t >= cfg_.t_max - kTimeEps) {
                done = true;
            }

            if (done || step % cfg_.sample_stride == 0) {
                path.push_back(x);
                path.push_back(t);
            }
        }
        longest = std::max(longest, path.size() / kDimension);
    }

    TrajectoryBatch out(count, longest, kDimension);
    for (std::size_t i = 0; i < count; ++i) {
        std::copy(paths[i].begin(), paths[i].end(), out.state(i, 0));
    }
    return out;
}

ScoreBatch DoubleWellModel::scoreCoordinate(const TrajectoryBatch& traj) const {
    ScoreBatch out(traj.count, traj.steps);
    const double span = cfg_.x_target - cfg_.x_start;
    for (std::size_t i = 0; i < traj.count; ++i) {
        for (std::size_t t = 0; t < traj.steps; ++t) {
            out.at(i, t) = (traj.at(i, t, 0) - cfg_.x_start) / span;
        }
    }
    return out;
}

RegionMask DoubleWellModel::isStart(const TrajectoryBatch& traj) const {
    RegionMask out(traj.count, traj.steps);
    for (std::size_t i = 0; i < traj.count; ++i) {
        for (std::size_t t = 0; t < traj.steps; ++t) {
            out.set(i, t, traj.at(i, t, 0) <= cfg_.x_start);
        }
    }
    return out;
}

RegionMask DoubleWellModel::isTarget(const TrajectoryBatch& traj) const {
    RegionMask out(traj.count, traj.steps);
    for (std::size_t i = 0; i < traj.count; ++i) {
        for (std::size_t t = 0; t < traj.steps; ++t) {
            out.set(i, t, traj.at(i, t, 0) >= cfg_.x_target);
        }
    }
    return out;
}

void DoubleWellModel::attachTo(AmsConfig& cfg) {
    cfg.state_dimension = kDimension;
    cfg.generator = [this](std::size_t count, const StateBatch& init) {
        return trajectories(count, init);
    };
    cfg.score = [this](const TrajectoryBatch& traj) { return scoreCoordinate(traj); };
    cfg.regions.is_start = [this](const TrajectoryBatch& traj) { return isStart(traj); };
    cfg.regions.is_target = [this](const TrajectoryBatch& traj) { return isTarget(traj); };
}

} // namespace models
} // namespace ams
