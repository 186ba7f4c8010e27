#pragma once

#include <stdexcept>
#include <string>

namespace pvar {

// Weight count differs from the number of asset columns.
class DimensionMismatch : public std::invalid_argument {
public:
    explicit DimensionMismatch(const std::string& what)
        : std::invalid_argument(what) {}
};

// Weights are unparsable or do not sum to 100 percent.
class InvalidWeights : public std::invalid_argument {
public:
    explicit InvalidWeights(const std::string& what)
        : std::invalid_argument(what) {}
};

// Confidence level outside the open interval (0, 100).
class UnsupportedConfidenceLevel : public std::invalid_argument {
public:
    explicit UnsupportedConfidenceLevel(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace pvar
