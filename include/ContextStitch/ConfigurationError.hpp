// =================================================================
// include/ContextStitch/ConfigurationError.hpp
// =================================================================
// Error raised for invalid configuration before any traversal starts.

#pragma once

#include <stdexcept>
#include <string>

namespace ContextStitch {

/**
 * @brief Fatal configuration problem (unknown preset, bad size, ...)
 *
 * Only thrown while assembling the run configuration; per-file problems
 * during a walk are recorded in the results instead.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace ContextStitch
