#pragma once
#include <stdexcept>
#include <string>

// Malformed single update (missing vocabulary id, unknown mode).
// Rejects that one answer only; the session carries on.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Raised by ProgressStore implementations when the backing medium
// cannot be read or written. Never retried by the engine.
class StoreUnavailable : public std::runtime_error {
public:
    explicit StoreUnavailable(const std::string& what) : std::runtime_error(what) {}
};
