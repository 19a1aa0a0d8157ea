#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace ams {

// Reseedable pseudo-random stream. Every draw advances the state; the full
// state can be saved and restored to replay a sequence exactly.
class RandomStream {
public:
    explicit RandomStream(std::uint64_t seed = 0u);

    void reseed(std::uint64_t seed);
    std::uint64_t seed() const { return seed_; }

    // Uniform integer in [0, n). n must be positive.
    std::size_t uniformIndex(std::size_t n);
    double uniform01();
    double normal();

    std::string saveState() const;
    // Throws std::invalid_argument if `state` was not produced by saveState().
    void restoreState(const std::string& state);

private:
    std::uint64_t seed_ = 0u;
    std::mt19937_64 engine_;
};

} // namespace ams
