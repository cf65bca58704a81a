#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the loopsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace loopsim::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown by loader functions when JSON input is malformed, required fields
/// are missing, or values fail semantic validation (e.g. a negative delay).
///
/// @ingroup io
/// @see load_scenario, compute_metrics_from_file
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Where the error was found, e.g. `submissions[2].then[0]`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace loopsim::io
