#pragma once

#include <stdexcept>
#include <string>

namespace execbox::sandbox {

// Malformed request input. Raised before any workspace exists.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// Workspace could not be created.
class ResourceError : public std::runtime_error {
public:
    explicit ResourceError(const std::string& message) : std::runtime_error(message) {}
};

class MaterializationError : public std::runtime_error {
public:
    explicit MaterializationError(const std::string& message) : std::runtime_error(message) {}
};

// Interpreter could not be started.
class ProcessError : public std::runtime_error {
public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace execbox::sandbox
