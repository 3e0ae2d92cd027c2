#ifndef FRNN_ERRORS_HPP
#define FRNN_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace frnn {

// Malformed k specification, weight family, metric or backend.
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument(what) {}
};

// Malformed data handed to construct (or to a utility).
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what)
        : std::invalid_argument(what) {}
};

// Query rows whose width differs from the constructed model.
class DimensionMismatch : public std::invalid_argument {
public:
    explicit DimensionMismatch(const std::string& what)
        : std::invalid_argument(what) {}
};

}  // namespace frnn

#endif  // FRNN_ERRORS_HPP
