#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// An external tool was missing, failed to start, or exited non-zero.
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& msg) : std::runtime_error(msg) {}
};

// An input was definitely unusable (missing, empty, unparsable super image).
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// The user declined a warning prompt.
class UserAbort : public std::runtime_error {
public:
    explicit UserAbort(const std::string& msg) : std::runtime_error(msg) {}
};

#endif // ERRORS_HPP
