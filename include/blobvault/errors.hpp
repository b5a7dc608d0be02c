#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace blobvault {

/// Base class for every error kind the core reports to its callers.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// No object exists under the supplied key.
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) : Error(message) {}
};

/// Backend unreachable, inconsistent, or a read/write primitive failed.
class StoreError : public Error {
public:
    explicit StoreError(const std::string& message) : Error(message) {}
};

/// Malformed or empty key supplied at the boundary.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

/// Backend cannot initialize (missing settings, unreachable remote resource).
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message) : Error(message) {}
};

/// Daily traffic ceiling already reached for the requesting origin.
class LimitExceededError : public Error {
public:
    enum class Direction { Upload, Download };

    LimitExceededError(Direction direction, uint64_t used, uint64_t limit)
        : Error(std::string(direction == Direction::Upload ? "upload" : "download") +
                " limit exceeded: " + std::to_string(used) + " of " +
                std::to_string(limit) + " bytes used today")
        , direction_(direction)
        , used_(used)
        , limit_(limit) {}

    Direction direction() const { return direction_; }
    uint64_t used() const { return used_; }
    uint64_t limit() const { return limit_; }

private:
    Direction direction_;
    uint64_t used_;
    uint64_t limit_;
};

}  // namespace blobvault
