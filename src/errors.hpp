// errors.hpp

#pragma once

#include <stdexcept>
#include <string>

// Fatal: bad options, unknown timezone, out of range values
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

class InvalidCoordinate : public ConfigurationError {
public:
    explicit InvalidCoordinate(const std::string& message)
        : ConfigurationError(message) {}
};

// Fatal: nothing to export (no images found or none survive classification)
class EmptyInputError : public std::runtime_error {
public:
    explicit EmptyInputError(const std::string& message)
        : std::runtime_error(message) {}
};

// Fatal: output directory cannot be used
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Non fatal, collected by the export pipeline
struct FrameFailure {
    int sequence;
    std::string source_path;
    std::string reason;
};
