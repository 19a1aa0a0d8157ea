#include "AmsTypes.h"

#include <algorithm>

namespace ams {

StateBatch StateBatch::tiled(std::size_t count, const std::vector<double>& s) {
    StateBatch out(count, s.size());
    for (std::size_t i = 0; i < count; ++i) {
        std::copy(s.begin(), s.end(), out.state(i));
    }
    return out;
}

std::size_t TrajectoryBatch::naturalLength(std::size_t i) const {
    for (std::size_t t = 0; t < steps; ++t) {
        const double* s = state(i, t);
        for (std::size_t d = 0; d < dim; ++d) {
            if (isUndefined(s[d])) {
                return t;
            }
        }
    }
    return steps;
}

void TrajectoryBatch::growSteps(std::size_t new_steps) {
    if (new_steps <= steps) {
        return;
    }

    std::vector<double> grown(count * new_steps * dim, kUndefined);
    const std::size_t old_row = steps * dim;
    const std::size_t new_row = new_steps * dim;
    for (std::size_t i = 0; i < count; ++i) {
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(i * old_row),
                  data.begin() + static_cast<std::ptrdiff_t>((i + 1) * old_row),
                  grown.begin() + static_cast<std::ptrdiff_t>(i * new_row));
    }
    data.swap(grown);
    steps = new_steps;
}

void TrajectoryBatch::clearFrom(std::size_t i, std::size_t from) {
    for (std::size_t t = from; t < steps; ++t) {
        double* s = state(i, t);
        std::fill(s, s + dim, kUndefined);
    }
}

void ScoreBatch::growSteps(std::size_t new_steps) {
    if (new_steps <= steps) {
        return;
    }

    std::vector<double> grown(count * new_steps, kUndefined);
    for (std::size_t i = 0; i < count; ++i) {
        std::copy(data.begin() + static_cast<std::ptrdiff_t>(i * steps),
                  data.begin() + static_cast<std::ptrdiff_t>((i + 1) * steps),
                  grown.begin() + static_cast<std::ptrdiff_t>(i * new_steps));
    }
    data.swap(grown);
    steps = new_steps;
}

void ScoreBatch::clearFrom(std::size_t i, std::size_t from) {
    for (std::size_t t = from; t < steps; ++t) {
        at(i, t) = kUndefined;
    }
}

bool maxIgnoringUndefined(const ScoreBatch& scores, std::size_t i, std::size_t length, double& out) {
    bool found = false;
    double best = 0.0;
    const std::size_t n = std::min(length, scores.steps);
    for (std::size_t t = 0; t < n; ++t) {
        const double v = scores.at(i, t);
        if (isUndefined(v)) {
            continue;
        }
        if (!found || v > best) {
            best = v;
            found = true;
        }
    }
    if (found) {
        out = best;
    }
    return found;
}

} // namespace ams
