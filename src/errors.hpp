#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace engram {

// Base for every error raised by the memory engine.
class MemoryError : public std::runtime_error {
public:
    explicit MemoryError(const std::string& message)
        : std::runtime_error(message) {}
};

// Malformed input: dimension mismatch, missing field, unknown outcome tag.
// Raised synchronously; nothing is written.
class ValidationError : public MemoryError {
public:
    ValidationError(const std::string& message, std::string field = {})
        : MemoryError(message), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

class EmbeddingError : public MemoryError {
public:
    using MemoryError::MemoryError;
};

class GenerationError : public MemoryError {
public:
    using MemoryError::MemoryError;
};

// Backing store unreachable or failing.
class StoreUnavailableError : public MemoryError {
public:
    using MemoryError::MemoryError;
};

// A caller-supplied deadline expired before an external call completed.
class DeadlineExceededError : public MemoryError {
public:
    using MemoryError::MemoryError;
};

} // namespace engram
