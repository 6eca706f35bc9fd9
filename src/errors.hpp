#pragma once
#include <stdexcept>
#include <string>

namespace engram {

// Base for every failure raised by the stores and the runner.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or out-of-range input. Never retried.
class ValidationError : public Error {
public:
    using Error::Error;
};

// Reference to a session or memory that does not exist.
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Session status change that would move backwards.
class InvalidTransitionError : public Error {
public:
    using Error::Error;
};

// Turn-number race still lost after the store's internal retries.
class ConcurrencyConflict : public Error {
public:
    using Error::Error;
};

// The model call failed, timed out or was cancelled.
class ExternalInvocationError : public Error {
public:
    using Error::Error;
};

// Backend failure that is not a race (I/O, corrupt file, bad SQL).
class StorageError : public Error {
public:
    using Error::Error;
};

} // namespace engram
