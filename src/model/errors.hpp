#pragma once

/// @file errors.hpp
/// @brief Exception types raised while turning user input into ratios

#include <stdexcept>

namespace contextviz {

/// Input that cannot form a ratio: non-numeric, non-positive, or an unknown
/// country. what() is the message shown to the user.
class InvalidInput : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/// A ratio computation hit a zero denominator or an unrepresentable quotient.
/// Validated input never reaches this; there is no recovery beyond aborting
/// the request.
class ArithmeticDegenerate : public std::domain_error {
  public:
    using std::domain_error::domain_error;
};

} // namespace contextviz
