#pragma once
// Fatal conversion errors. Every one of them aborts the run.

#include <stdexcept>
#include <string>

namespace democonv {

class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A candidate episode file failed to open or does not match the episode schema.
class CorruptInputError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

// Joint vector width disagrees with the kinematic model or the arm slice.
class ShapeMismatchError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

class UnknownCalibrationError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

class DuplicateDemoIndexError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

class EmptyDatasetError : public ConversionError {
public:
    using ConversionError::ConversionError;
};

} // namespace democonv
