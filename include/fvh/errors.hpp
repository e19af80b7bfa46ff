#pragma once

/// @file include/fvh/errors.hpp
/// @brief Exception types for contract violations.
///
/// Only two conditions are fatal: an invalid ParameterSet and a look-ahead
/// into a period after the evaluation period. Missing data is never thrown;
/// it degrades to neutral and is recorded on the Prediction.

#include "fvh/types.hpp"

#include <stdexcept>
#include <string>

namespace fvh {

/// Root of every exception the core throws.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A ParameterSet violated one of its invariants.
class InvalidParameterSet : public Error {
public:
    using Error::Error;
};

/// Data from a period after the evaluation period reached a computation.
class LookaheadViolation : public Error {
public:
    LookaheadViolation(const PlayerId& player, Period as_of, Period offending);

    [[nodiscard]] Period as_of() const noexcept { return as_of_; }
    [[nodiscard]] Period offending_period() const noexcept { return offending_; }

private:
    Period as_of_;
    Period offending_;
};

} // namespace fvh
