#include "AmsEstimator.h"

#include "Log.h"

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace ams {

namespace {
std::string describeShape(std::size_t count, std::size_t steps, std::size_t dim) {
    std::ostringstream out;
    out << "[" << count << " x " << steps << " x " << dim << "]";
    return out.str();
}

RunRecord toRecord(const AmsResult& r) {
    RunRecord rec{};
    rec.probability = r.probability;
    rec.iterations = r.iterations;
    rec.transitions = r.transitions;
    rec.runtime_s = r.runtime_s;
    return rec;
}

// First step t < length with score >= level, or length if none.
std::size_t firstReaching(const ScoreBatch& scores, std::size_t i, std::size_t length, double level) {
    for (std::size_t t = 0; t < length; ++t) {
        const double v = scores.at(i, t);
        if (!isUndefined(v) && v >= level) {
            return t;
        }
    }
    return length;
}
} // namespace

std::size_t countDistinct(const std::vector<double>& values) {
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    return static_cast<std::size_t>(std::unique(sorted.begin(), sorted.end()) - sorted.begin());
}

AmsEstimator::AmsEstimator(const AmsConfig& config)
    : config_(config), rng_(config.seed) {
    if (config_.survivors_per_level < 1 || config_.survivors_per_level >= config_.ensemble_size) {
        throw ConfigurationError("survivors per level must satisfy 1 <= nc < N, got nc=" +
                                 std::to_string(config_.survivors_per_level) +
                                 " N=" + std::to_string(config_.ensemble_size));
    }
    if (config_.state_dimension < 1) {
        throw ConfigurationError("state dimension must be positive");
    }
    if (!config_.generator) {
        throw ConfigurationError("trajectory generator is not set");
    }
    if (!config_.score) {
        throw ConfigurationError("score function is not set");
    }
    if (!config_.regions.is_start || !config_.regions.is_target) {
        throw ConfigurationError("region classifier is not set");
    }
}

TrajectoryBatch AmsEstimator::generate(std::size_t count, const StateBatch& init) const {
    TrajectoryBatch out = config_.generator(count, init);
    if (out.dim != config_.state_dimension) {
        throw ContractViolation("generator returned state dimension " + std::to_string(out.dim) +
                                ", expected " + std::to_string(config_.state_dimension));
    }
    if (out.count != count) {
        throw ContractViolation("generator returned " + std::to_string(out.count) +
                                " trajectories, expected " + std::to_string(count));
    }
    if (out.data.size() != out.count * out.steps * out.dim) {
        throw ContractViolation("generator storage does not match its shape " +
                                describeShape(out.count, out.steps, out.dim));
    }
    return out;
}

ScoreBatch AmsEstimator::scoreOf(const TrajectoryBatch& trajectories) const {
    ScoreBatch out = config_.score(trajectories);
    if (out.count != trajectories.count || out.steps != trajectories.steps ||
        out.data.size() != out.count * out.steps) {
        throw ContractViolation("score function returned " + describeShape(out.count, out.steps, 1) +
                                " for trajectories " +
                                describeShape(trajectories.count, trajectories.steps, trajectories.dim));
    }
    return out;
}

void AmsEstimator::applyRegionOverride(const TrajectoryBatch& trajectories,
                                       ScoreBatch& scores,
                                       const std::vector<std::size_t>& lengths) const {
    const RegionMask start = config_.regions.is_start(trajectories);
    const RegionMask target = config_.regions.is_target(trajectories);
    for (const RegionMask* m : {&start, &target}) {
        if (m->count != trajectories.count || m->steps != trajectories.steps ||
            m->data.size() != m->count * m->steps) {
            throw ContractViolation("region classifier returned a mask of shape " +
                                    describeShape(m->count, m->steps, 1));
        }
    }

    for (std::size_t i = 0; i < trajectories.count; ++i) {
        const std::size_t n = std::min(lengths[i], trajectories.steps);
        for (std::size_t t = 0; t < n; ++t) {
            const bool in_start = start.at(i, t);
            const bool in_target = target.at(i, t);
            if (in_start && in_target) {
                throw ContractViolation("step " + std::to_string(t) + " of trajectory " +
                                        std::to_string(i) + " is in both start and target regions");
            }
            if (in_start) {
                scores.at(i, t) = 0.0;
            } else if (in_target) {
                scores.at(i, t) = 1.0;
            }
        }
    }
}

std::vector<double> AmsEstimator::levelsOf(const ScoreBatch& scores,
                                           const std::vector<std::size_t>& lengths) const {
    std::vector<double> q(scores.count, 0.0);
    for (std::size_t i = 0; i < scores.count; ++i) {
        if (!maxIgnoringUndefined(scores, i, lengths[i], q[i])) {
            throw DegenerateTrajectoryError("trajectory " + std::to_string(i) + " has no defined step");
        }
    }
    return q;
}

AmsResult AmsEstimator::run(const StateBatch& initial_states, double collapse_threshold) {
    const std::size_t n_traj = config_.ensemble_size;
    const std::size_t nc = config_.survivors_per_level;
    const std::size_t dim = config_.state_dimension;

    if (initial_states.count != n_traj || initial_states.dim != dim ||
        initial_states.data.size() != n_traj * dim) {
        throw ConfigurationError("initial states have shape " +
                                 describeShape(initial_states.count, 1, initial_states.dim) +
                                 ", expected " + describeShape(n_traj, 1, dim));
    }

    const auto t_start = std::chrono::steady_clock::now();

    AmsResult result{};
    TrajectoryBatch traj = generate(n_traj, initial_states);
    std::vector<std::size_t> lengths(n_traj, 0);
    for (std::size_t i = 0; i < n_traj; ++i) {
        lengths[i] = traj.naturalLength(i);
    }

    ScoreBatch score = scoreOf(traj);
    applyRegionOverride(traj, score, lengths);
    std::vector<double> q = levelsOf(score, lengths);

    double w = 1.0;
    std::size_t k = 0;

    while (true) {
        std::vector<double> distinct = q;
        std::sort(distinct.begin(), distinct.end());
        distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
        if (distinct.size() <= nc) {
            break;
        }
        if (config_.max_iterations > 0 && k >= config_.max_iterations) {
            result.converged = false;
            logLine(LogLevel::Warn, "run stopped at max_iterations=" + std::to_string(k) + " with " +
                                        std::to_string(distinct.size()) + " distinct levels left");
            break;
        }

        const double threshold = distinct[nc - 1];
        std::vector<std::size_t> idx;
        std::vector<std::size_t> other_idx;
        for (std::size_t i = 0; i < n_traj; ++i) {
            if (q[i] <= threshold) {
                idx.push_back(i);
            } else {
                other_idx.push_back(i);
            }
        }
        const std::size_t m = idx.size();

        w *= 1.0 - static_cast<double>(m) / static_cast<double>(n_traj);

        // Clone sources with replacement, then the first step at which each
        // source reached the level of the slot it replaces.
        std::vector<std::size_t> source(m, 0);
        std::vector<std::size_t> restart(m, 0);
        StateBatch init_clone(m, dim);
        for (std::size_t j = 0; j < m; ++j) {
            source[j] = other_idx[rng_.uniformIndex(other_idx.size())];
            const std::size_t src = source[j];
            restart[j] = firstReaching(score, src, lengths[src], q[idx[j]]);
            if (restart[j] >= lengths[src]) {
                throw std::logic_error("AMS: clone source never reaches the discarded level");
            }
            const double* s = traj.state(src, restart[j]);
            std::copy(s, s + dim, init_clone.state(j));
        }

        const TrajectoryBatch fresh = generate(m, init_clone);
        const ScoreBatch fresh_score = scoreOf(fresh);

        std::vector<std::size_t> fresh_len(m, 0);
        std::size_t new_max = 0;
        for (std::size_t j = 0; j < m; ++j) {
            fresh_len[j] = fresh.naturalLength(j);
            if (fresh_len[j] == 0) {
                throw DegenerateTrajectoryError("regenerated trajectory for slot " + std::to_string(idx[j]) +
                                                " is undefined from its first step");
            }
            new_max = std::max(new_max, restart[j] + fresh_len[j]);
        }

        if (new_max > traj.steps) {
            traj.growSteps(new_max);
            score.growSteps(new_max);
        }

        for (std::size_t j = 0; j < m; ++j) {
            const std::size_t t = idx[j];
            const std::size_t src = source[j];
            const std::size_t r = restart[j];
            const std::size_t l = fresh_len[j];

            std::copy(traj.state(src, 0), traj.state(src, 0) + (r + 1) * dim, traj.state(t, 0));
            std::copy(fresh.state(j, 1), fresh.state(j, 1) + (l - 1) * dim, traj.state(t, r + 1));
            traj.clearFrom(t, r + l);

            for (std::size_t s = 0; s <= r; ++s) {
                score.at(t, s) = score.at(src, s);
            }
            for (std::size_t s = 1; s < l; ++s) {
                score.at(t, r + s) = fresh_score.at(j, s);
            }
            score.clearFrom(t, r + l);

            lengths[t] = r + l;
        }

        // Region override on the rewritten trajectories as a whole.
        TrajectoryBatch rewritten(m, traj.steps, dim);
        ScoreBatch rewritten_score(m, traj.steps);
        std::vector<std::size_t> rewritten_len(m, 0);
        for (std::size_t j = 0; j < m; ++j) {
            const std::size_t t = idx[j];
            std::copy(traj.state(t, 0), traj.state(t, 0) + traj.steps * dim, rewritten.state(j, 0));
            for (std::size_t s = 0; s < traj.steps; ++s) {
                rewritten_score.at(j, s) = score.at(t, s);
            }
            rewritten_len[j] = lengths[t];
        }
        applyRegionOverride(rewritten, rewritten_score, rewritten_len);
        for (std::size_t j = 0; j < m; ++j) {
            for (std::size_t s = 0; s < traj.steps; ++s) {
                score.at(idx[j], s) = rewritten_score.at(j, s);
            }
        }

        IterationRecord rec{};
        rec.iteration = k;
        rec.distinct_levels = distinct.size();
        rec.level_threshold = threshold;
        rec.discarded = m;
        rec.weight = w;
        result.history.push_back(rec);

        if (logEnabled(LogLevel::Debug)) {
            std::ostringstream msg;
            msg << "iteration " << k << ": levels=" << distinct.size() << " threshold=" << threshold
                << " discarded=" << m << " weight=" << w;
            logLine(LogLevel::Debug, msg.str());
        }

        ++k;
        q = levelsOf(score, lengths);
    }

    std::size_t count_collapse = 0;
    for (double level : q) {
        if (level >= collapse_threshold) {
            ++count_collapse;
        }
    }

    const auto t_end = std::chrono::steady_clock::now();

    result.probability = w * static_cast<double>(count_collapse) / static_cast<double>(n_traj);
    result.iterations = k;
    result.transitions = count_collapse;
    result.weight = w;
    result.levels = q;
    result.lengths = lengths;
    result.trajectories = std::move(traj);
    result.scores = std::move(score);
    result.runtime_s = std::chrono::duration<double>(t_end - t_start).count();

    if (logEnabled(LogLevel::Info)) {
        std::ostringstream msg;
        msg << "run N=" << n_traj << " nc=" << nc << ": iterations=" << k
            << " transitions=" << count_collapse << " probability=" << result.probability
            << " runtime_s=" << result.runtime_s;
        logLine(LogLevel::Info, msg.str());
    }
    return result;
}

RunTable AmsEstimator::runMultiple(std::size_t count, const StateBatch& initial_states, double collapse_threshold) {
    RunTable table{};
    table.rows.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        if (config_.failure_policy == FailurePolicy::Abort) {
            table.rows.push_back(toRecord(run(initial_states, collapse_threshold)));
            continue;
        }

        try {
            table.rows.push_back(toRecord(run(initial_states, collapse_threshold)));
        } catch (const std::exception& e) {
            ++table.failed_runs;
            logLine(LogLevel::Warn, "run " + std::to_string(i) + " skipped: " + e.what());
        }
    }
    return table;
}

} // namespace ams
