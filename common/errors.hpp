#ifndef FUNNEL_COMMON_ERRORS_HPP
#define FUNNEL_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace funnel {

// Invalid tolerances or configuration file content.
// Raised before any curve is constructed.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Malformed input curve (length mismatch, empty, descending x)
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// Envelope construction produced an unusable curve
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& msg)
        : std::runtime_error(msg) {}
};

}  // namespace funnel

#endif // FUNNEL_COMMON_ERRORS_HPP
