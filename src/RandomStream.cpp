#include "RandomStream.h"

#include <sstream>
#include <stdexcept>

namespace ams {

RandomStream::RandomStream(std::uint64_t seed) : seed_(seed), engine_(seed) {}

void RandomStream::reseed(std::uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
}

std::size_t RandomStream::uniformIndex(std::size_t n) {
    if (n == 0) {
        throw std::invalid_argument("RandomStream::uniformIndex: empty range");
    }
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(engine_);
}

double RandomStream::uniform01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

double RandomStream::normal() {
    std::normal_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

std::string RandomStream::saveState() const {
    std::ostringstream out;
    out << seed_ << ' ' << engine_;
    return out.str();
}

void RandomStream::restoreState(const std::string& state) {
    std::istringstream in(state);
    std::uint64_t seed = 0u;
    std::mt19937_64 engine;
    in >> seed >> engine;
    if (in.fail()) {
        throw std::invalid_argument("RandomStream::restoreState: malformed state");
    }
    seed_ = seed;
    engine_ = engine;
}

} // namespace ams
