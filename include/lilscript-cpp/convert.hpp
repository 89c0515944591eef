/// @file convert.hpp
/// @brief File formats and the one-call conversion entry point.

#pragma once

#include <lilscript-cpp/tex.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace lilscript_cpp {

/// The file formats the library knows about.
enum class FileFormat : std::uint8_t {
    tex,       ///< A LaTeX (.tex) script.
    markdown,  ///< A Markdown (.md) document.
};

/// Convert a FileFormat to its string representation.
constexpr auto to_string_view(FileFormat format) noexcept -> std::string_view {
    switch (format) {
        case FileFormat::tex:      return "Tex";
        case FileFormat::markdown: return "Markdown";
    }
    return "Unknown";
}

/// Determine the file format from a path's extension.
/// @throws ParseError (unknown_format) for anything but .tex and .md.
auto format_from_path(const std::filesystem::path& path) -> FileFormat;

/// True iff `from` -> `to` is a supported conversion (only TeX -> Markdown).
constexpr auto is_supported(FileFormat from, FileFormat to) noexcept -> bool {
    return from == FileFormat::tex && to == FileFormat::markdown;
}

/// Convert `text` from one format to another.
///
/// The pairing is checked before any parsing happens.
/// @throws ParseError (unsupported_conversion) for unsupported pairings,
///   and any error from parse_script().
auto convert(std::string_view text, FileFormat from, FileFormat to,
             const ParseOptions& options = {}) -> std::string;

}  // namespace lilscript_cpp
