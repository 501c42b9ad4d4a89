#pragma once

/// @file include/polyreg/errors.hpp
/// @brief The single error type raised by polyreg for out-of-domain input.
///
/// ## Guarantees
/// - Thrown synchronously at the offending call, never caught inside the library
/// - `what()` reads "<parameter> must be ..." so callers can report it verbatim
/// - `parameter()` names the argument that violated its domain

#include <stdexcept>
#include <string>
#include <utility>

namespace polyreg {

/// Raised when an argument lies outside its documented domain.
class InvalidParameterError : public std::invalid_argument {
public:
    /// @param parameter  Name of the offending argument (e.g. "mu").
    /// @param message    Full human-readable message (e.g. "mu must be > 0").
    InvalidParameterError(std::string parameter, const std::string& message)
        : std::invalid_argument(message)
        , parameter_(std::move(parameter)) {}

    /// Name of the argument that failed validation.
    [[nodiscard]] const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

} // namespace polyreg
