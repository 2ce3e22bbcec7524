#pragma once

#include <stdexcept>
#include <string>

namespace kiln {

class KilnError : public std::runtime_error {
public:
    explicit KilnError(const std::string& message)
        : std::runtime_error(message) {}
};

// Record lookup failed
class NotFoundError : public KilnError {
public:
    explicit NotFoundError(const std::string& message)
        : KilnError("Not found: " + message) {}
};

// Operation rejected because of the record's current state
class ConflictError : public KilnError {
public:
    explicit ConflictError(const std::string& message)
        : KilnError("Conflict: " + message) {}
};

// Persisted state could not be read or written
class StoreError : public KilnError {
public:
    explicit StoreError(const std::string& message)
        : KilnError("State store: " + message) {}
};

class ConfigError : public KilnError {
public:
    explicit ConfigError(const std::string& message)
        : KilnError("Config: " + message) {}
};

} // namespace kiln
