#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace grafdiff {

/// Root of every error the library throws.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A version, diff or entity id did not resolve.
class NotFoundError : public Error {
public:
    using Error::Error;
};

/// Malformed input: an unparseable patch path, an ill-typed option,
/// an entity JSON document missing its id.
class ValidationError : public Error {
public:
    using Error::Error;
};

/// A patch operation was rejected; carries its position in the patch.
class PatchOperationError : public ValidationError {
public:
    PatchOperationError(size_t operation_index, const std::string& message)
        : ValidationError(message), operation_index_(operation_index) {}

    size_t operationIndex() const { return operation_index_; }

private:
    size_t operation_index_;
};

/// A patch checksum does not match its operation list.
class IntegrityError : public Error {
public:
    using Error::Error;
};

/// The deep object differ exceeded its recursion bound.
class DepthLimitError : public Error {
public:
    using Error::Error;
};

} // namespace grafdiff
