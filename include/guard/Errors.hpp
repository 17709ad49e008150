#pragma once

#include <stdexcept>
#include <string>

namespace guard {

// Path resolved outside the project root, or hit a deny-listed directory.
// what() always starts with "Security violation:".
class SecurityViolation : public std::runtime_error {
public:
    explicit SecurityViolation(const std::string& detail)
        : std::runtime_error("Security violation: " + detail) {}
};

class FileNotFound : public std::runtime_error {
public:
    explicit FileNotFound(const std::string& path)
        : std::runtime_error("file not found: " + path) {}
};

class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace guard
