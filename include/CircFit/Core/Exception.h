#pragma once

#include <CircFit/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for CircFit
 *
 * Every exception carries an ErrorKind so callers can branch on the failure
 * category without string matching. Messages are prefixed with the name of
 * the function that rejected the input, e.g. "CurvatureFit: ...".
 */

#include <stdexcept>
#include <string>

namespace Circ::Fit {

/**
 * @brief Failure categories
 */
enum class ErrorKind {
    Generic,            ///< Unclassified failure
    ShapeMismatch,      ///< Dimension/length disagreement across inputs
    NonFiniteInput,     ///< NaN or Inf where finite real values are required
    TooFewPoints,       ///< Point count below the algorithm minimum
    InvalidParameter,   ///< Scalar parameter out of range or not integral
    InvalidArity,       ///< Wrong number of (optional) arguments
    Collinearity        ///< Degenerate geometry where a fit must be well posed
};

/**
 * @brief Base exception class for CircFit
 */
class CIRCFIT_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message, ErrorKind kind = ErrorKind::Generic)
        : std::runtime_error(message), kind_(kind) {}

    explicit Exception(const char* message, ErrorKind kind = ErrorKind::Generic)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Coordinate inputs disagree in length, shape, or vector/array-ness
 */
class CIRCFIT_API ShapeMismatchException : public Exception {
public:
    explicit ShapeMismatchException(const std::string& message)
        : Exception("Shape mismatch: " + message, ErrorKind::ShapeMismatch) {}
};

/**
 * @brief NaN or Inf found in coordinates or scalar parameters
 */
class CIRCFIT_API NonFiniteInputException : public Exception {
public:
    explicit NonFiniteInputException(const std::string& message)
        : Exception("Non-finite input: " + message, ErrorKind::NonFiniteInput) {}
};

/**
 * @brief Insufficient data for algorithm (e.g., not enough points for fitting)
 */
class CIRCFIT_API InsufficientDataException : public Exception {
public:
    explicit InsufficientDataException(const std::string& message)
        : Exception("Insufficient data: " + message, ErrorKind::TooFewPoints) {}
};

/**
 * @brief Invalid scalar argument (negative radius, non-integer window, ...)
 */
class CIRCFIT_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message, ErrorKind::InvalidParameter) {}
};

/**
 * @brief Wrong number of arguments for a variadic or optional-argument call
 */
class CIRCFIT_API InvalidArityException : public Exception {
public:
    explicit InvalidArityException(const std::string& message)
        : Exception("Invalid arity: " + message, ErrorKind::InvalidArity) {}
};

/**
 * @brief Points are collinear (or nearly so) where a circle must be well posed
 */
class CIRCFIT_API CollinearityException : public Exception {
public:
    explicit CollinearityException(const std::string& message)
        : Exception("Collinearity: " + message, ErrorKind::Collinearity) {}
};

} // namespace Circ::Fit
