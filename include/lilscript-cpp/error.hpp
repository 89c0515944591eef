/// @file error.hpp
/// @brief Error types for the lilscript-cpp library.

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lilscript_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    missing_field,           ///< A mandatory header command is absent.
    invalid_line,            ///< A body line does not match the container grammar.
    unknown_inline_command,  ///< A span-position command outside {direct, ul}.
    unsupported_conversion,  ///< A source/target pairing other than TeX -> Markdown.
    unknown_format,          ///< A file format could not be determined from a path.
    io_error,                ///< A file could not be read or written.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::missing_field:          return "missing_field";
        case ErrorKind::invalid_line:           return "invalid_line";
        case ErrorKind::unknown_inline_command: return "unknown_inline_command";
        case ErrorKind::unsupported_conversion: return "unsupported_conversion";
        case ErrorKind::unknown_format:         return "unknown_format";
        case ErrorKind::io_error:               return "io_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;                    ///< The category of this error.
    std::string message;               ///< A human-readable description.
    std::optional<std::string> field;  ///< The metadata field, for missing_field.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by every parsing and conversion entry point.
///
/// Carries the structured Error; what() returns the error message.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    ParseError(ErrorKind kind, std::string msg)
        : ParseError{Error{kind, std::move(msg)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace lilscript_cpp
