#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    NotFound,
    ConstraintViolation,
    StorageUnavailable,
    MalformedInput
};

const char* to_string(ErrorKind kind);

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Referenced parent row is absent (e.g. interaction against a missing document).
class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& msg) : StoreError(ErrorKind::NotFound, msg) {}
};

class ConstraintViolationError : public StoreError {
public:
    explicit ConstraintViolationError(const std::string& msg) : StoreError(ErrorKind::ConstraintViolation, msg) {}
};

// Open/prepare/step/I/O failure. Not retried here.
class StorageUnavailableError : public StoreError {
public:
    explicit StorageUnavailableError(const std::string& msg) : StoreError(ErrorKind::StorageUnavailable, msg) {}
};

class MalformedInputError : public StoreError {
public:
    explicit MalformedInputError(const std::string& msg) : StoreError(ErrorKind::MalformedInput, msg) {}
};
