#ifndef FORMULIZE_ERRORS_HPP
#define FORMULIZE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

namespace formulize {

// Base class for every error raised by the engine
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Invalid computation setup (no computed variables, no expressions).
 * Aborts set_computation and is always visible to the caller.
 */
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message)
        : Error("Configuration error: " + message) {}
};

class UnknownVariableError : public Error {
public:
    explicit UnknownVariableError(const std::string& id)
        : Error("Unknown variable: " + id), id_(id) {}

    const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

class ParseError : public Error {
public:
    ParseError(const std::string& message, std::size_t position = 0)
        : Error("Parse error: " + message + " at position " + std::to_string(position)),
          position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

// A single evaluation attempt failed (undefined symbol, type mismatch, ...)
class EvaluationError : public Error {
public:
    explicit EvaluationError(const std::string& message)
        : Error("Evaluation error: " + message) {}
};

// Generated evaluate() text failed validation or left the allowed grammar
class GeneratedCodeInvalid : public Error {
public:
    explicit GeneratedCodeInvalid(const std::string& message)
        : Error("Generated code invalid: " + message) {}
};

class GenerationTransportError : public Error {
public:
    explicit GenerationTransportError(const std::string& message, int status = 0)
        : Error("Generation request failed: " + message), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

} // namespace formulize

#endif // FORMULIZE_ERRORS_HPP
