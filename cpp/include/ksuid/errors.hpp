#pragma once

#include <stdexcept>
#include <string>

namespace ksuid {

// Root of every error the library throws on bad input.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Wrong payload or buffer length, timestamp out of range, malformed prefixed id.
class ValidationError : public Error {
public:
    using Error::Error;
};

// Wrong string length, character outside the alphabet, or a value above 2^160 - 1.
class DecodeError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

}  // namespace ksuid
