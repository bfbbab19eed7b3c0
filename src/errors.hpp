#pragma once

/**
 * Exception types raised by the console helpers.
 *
 * Ordinary runtime conditions derive from std::runtime_error. Programming
 * errors derive from ProgrammingError and are never recovered by the
 * progress scope. Interrupted sits outside std::exception so that generic
 * handlers in caller code cannot mistake a cancellation for a failure.
 */

#include <stdexcept>
#include <string>

namespace conz {

// Base class for caller and library bugs (bad color names, misuse).
class ProgrammingError : public std::logic_error {
public:
    explicit ProgrammingError(const std::string& msg) : std::logic_error(msg) {}
};

// Unknown color, style or background name.
class LookupError : public ProgrammingError {
public:
    LookupError(const std::string& axis, const std::string& name)
        : ProgrammingError("Unknown " + axis + " name: '" + name + "'"),
          axis_(axis), name_(name) {}

    const std::string& axis() const { return axis_; }
    const std::string& name() const { return name_; }

private:
    std::string axis_;
    std::string name_;
};

// A progress step was resolved twice.
class ProgressMisuse : public ProgrammingError {
public:
    explicit ProgressMisuse(const std::string& msg) : ProgrammingError(msg) {}
};

// A helper was called with arguments it cannot work with.
class UsageError : public ProgrammingError {
public:
    explicit UsageError(const std::string& msg) : ProgrammingError(msg) {}
};

// Input source closed while a prompt was waiting for an answer.
class EndOfInput : public std::runtime_error {
public:
    EndOfInput() : std::runtime_error("End of input") {}
};

// Configuration file exists but cannot be used.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * User interrupt (SIGINT) observed while the program was waiting for input.
 *
 * Not derived from std::exception.
 */
class Interrupted {
public:
    const char* what() const noexcept { return "Interrupted"; }
};

} // namespace conz
