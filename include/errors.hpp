/*
 * Error Types
 *
 * Exceptions raised at subsystem boundaries. Operational calls (sockets,
 * virtual devices, sends) report failure through bool results instead.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace input_link {

// Device backend or virtual-device driver could not start
class InitializationError : public std::runtime_error {
public:
    explicit InitializationError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed or type-mismatched wire message
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Data model invariant violated (e.g. controller number out of range)
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace input_link

#endif // ERRORS_HPP
