#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace ams {

// Reserved marker for time steps past a trajectory's natural end.
// Never a valid coordinate or score.
constexpr double kUndefined = std::numeric_limits<double>::quiet_NaN();

inline bool isUndefined(double x) { return std::isnan(x); }

// A batch of single states, row-major [count][dim].
struct StateBatch {
    std::size_t count = 0;
    std::size_t dim = 0;
    std::vector<double> data;

    StateBatch() = default;
    StateBatch(std::size_t count_, std::size_t dim_, double fill = 0.0)
        : count(count_), dim(dim_), data(count_ * dim_, fill) {}

    double* state(std::size_t i) { return data.data() + i * dim; }
    const double* state(std::size_t i) const { return data.data() + i * dim; }

    // Same state repeated for every slot.
    static StateBatch tiled(std::size_t count, const std::vector<double>& s);
};

// Ragged trajectories stored at a common allocated length.
// Layout is row-major [count][steps][dim]; the unused tail of every
// trajectory holds kUndefined.
struct TrajectoryBatch {
    std::size_t count = 0;
    std::size_t steps = 0;
    std::size_t dim = 0;
    std::vector<double> data;

    TrajectoryBatch() = default;
    TrajectoryBatch(std::size_t count_, std::size_t steps_, std::size_t dim_)
        : count(count_), steps(steps_), dim(dim_), data(count_ * steps_ * dim_, kUndefined) {}

    double& at(std::size_t i, std::size_t t, std::size_t d) { return data[(i * steps + t) * dim + d]; }
    double at(std::size_t i, std::size_t t, std::size_t d) const { return data[(i * steps + t) * dim + d]; }

    double* state(std::size_t i, std::size_t t) { return data.data() + (i * steps + t) * dim; }
    const double* state(std::size_t i, std::size_t t) const { return data.data() + (i * steps + t) * dim; }

    // First step at which any component is undefined, or `steps` if none.
    std::size_t naturalLength(std::size_t i) const;

    // Enlarge the allocated length. Existing entries keep their values,
    // the new tail is kUndefined. Never shrinks.
    void growSteps(std::size_t new_steps);

    // Reset steps [from, steps) of trajectory i to kUndefined.
    void clearFrom(std::size_t i, std::size_t from);
};

// One scalar per trajectory per step, row-major [count][steps].
struct ScoreBatch {
    std::size_t count = 0;
    std::size_t steps = 0;
    std::vector<double> data;

    ScoreBatch() = default;
    ScoreBatch(std::size_t count_, std::size_t steps_)
        : count(count_), steps(steps_), data(count_ * steps_, kUndefined) {}

    double& at(std::size_t i, std::size_t t) { return data[i * steps + t]; }
    double at(std::size_t i, std::size_t t) const { return data[i * steps + t]; }

    void growSteps(std::size_t new_steps);
    void clearFrom(std::size_t i, std::size_t from);
};

// Per trajectory per step flag, row-major [count][steps].
struct RegionMask {
    std::size_t count = 0;
    std::size_t steps = 0;
    std::vector<unsigned char> data;

    RegionMask() = default;
    RegionMask(std::size_t count_, std::size_t steps_)
        : count(count_), steps(steps_), data(count_ * steps_, 0u) {}

    bool at(std::size_t i, std::size_t t) const { return data[i * steps + t] != 0u; }
    void set(std::size_t i, std::size_t t, bool v) { data[i * steps + t] = v ? 1u : 0u; }
};

// Maximum of row i over steps [0, length), skipping undefined entries.
// Returns false when no defined entry exists.
bool maxIgnoringUndefined(const ScoreBatch& scores, std::size_t i, std::size_t length, double& out);

} // namespace ams
