#pragma once

#include <stdexcept>
#include <string>

namespace ams {

class AmsError : public std::runtime_error {
public:
    explicit AmsError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid estimator setup or run inputs. Raised before any simulation work.
class ConfigurationError : public AmsError {
public:
    explicit ConfigurationError(const std::string& what) : AmsError("configuration error: " + what) {}
};

// A collaborator returned data that breaks its contract (shape, dimension,
// overlapping regions).
class ContractViolation : public AmsError {
public:
    explicit ContractViolation(const std::string& what) : AmsError("contract violation: " + what) {}
};

// A trajectory with no defined step, which leaves no level and no restart point.
class DegenerateTrajectoryError : public AmsError {
public:
    explicit DegenerateTrajectoryError(const std::string& what) : AmsError("degenerate trajectory: " + what) {}
};

} // namespace ams
