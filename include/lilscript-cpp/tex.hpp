/// @file tex.hpp
/// @brief Parsing of TeX-formatted scripts into the Script model.
///
/// The pipeline is normalize -> partition -> parse_span -> parse_container
/// -> parse_script. Every step is usable on its own. Failures are reported
/// by throwing ParseError.

#pragma once

#include <lilscript-cpp/container.hpp>
#include <lilscript-cpp/error.hpp>
#include <lilscript-cpp/script.hpp>
#include <lilscript-cpp/span.hpp>

#include <re2/re2.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lilscript_cpp {

// -- Normalizer ---------------------------------------------------------------

/// Replace TeX idioms with plain text and collapse whitespace.
///
/// Handles `\ldots`, `\textellipsis` (with or without `{}`), ``quotes'',
/// `\%` `\&` `\$`, `\kaosmile`, `\Tilde` and `\href{URL}{TEXT}` (which
/// becomes `[TEXT](URL)`). Unknown commands are left untouched.
/// @code
/// normalize(R"(some text\textellipsis{} and more)");  // "some text... and more"
/// @endcode
auto normalize(std::string_view text) -> std::string;

// -- Partitioner --------------------------------------------------------------

/// Split `text` around the matches of `pattern`, keeping the matches.
///
/// The result alternates "text before a match" and "the match", followed
/// by the remainder after the last match when it is non-empty. Segments
/// may be empty. Joining all segments reproduces `text` exactly.
/// @code
/// partition(RE2{"C+"}, "ABCCQBCPCCC");  // {"AB", "CC", "QB", "C", "P", "CCC"}
/// @endcode
auto partition(const re2::RE2& pattern, std::string_view text)
    -> std::vector<std::string_view>;

/// The pattern matching one inline command with a single argument.
auto inline_command_pattern() -> const re2::RE2&;

// -- Spans and containers -----------------------------------------------------

/// Classify one partitioned fragment.
///
/// Prose becomes a normal span; `\direct{...}` an inline direction and
/// `\ul{...}` emphasis.
/// @throws ParseError (unknown_inline_command) for any other command.
auto parse_span(std::string_view fragment) -> Span;

/// Parse one body line of the shape `\command{body}`.
///
/// Unknown commands give a plain_text container and a logged warning.
/// @throws ParseError (invalid_line) if the line is not a command.
/// @throws ParseError (unknown_inline_command) if a span fails to parse;
///   the message names the line.
auto parse_container(std::string_view line) -> Container;

// -- Metadata -----------------------------------------------------------------

/// The mandatory header fields of a script.
enum class MetadataField : std::uint8_t {
    title,    ///< `\renewcommand{\SceneName}{...}`
    author,   ///< `\scriptAuthor{...}`
    series,   ///< `\scriptSeries{...}`
    tags,     ///< `\scriptTags{...}`
    summary,  ///< `\summary{...}`
};

/// Convert a MetadataField to its string representation.
constexpr auto to_string_view(MetadataField field) noexcept -> std::string_view {
    switch (field) {
        case MetadataField::title:   return "title";
        case MetadataField::author:  return "author";
        case MetadataField::series:  return "series";
        case MetadataField::tags:    return "tags";
        case MetadataField::summary: return "summary";
    }
    return "unknown";
}

/// Find the value of a header field, or nullopt if it is absent.
auto find_metadata(MetadataField field, std::string_view text)
    -> std::optional<std::string_view>;

/// Find the argument of the first `\command{...}` in `text`.
///
/// `command` is matched literally. The value ends at the first `}`.
auto search_command(std::string_view command, std::string_view text)
    -> std::optional<std::string_view>;

/// Split "[a][b][c]" into {"a", "b", "c"}.
auto parse_tags(std::string_view value) -> std::vector<std::string>;

// -- Script -------------------------------------------------------------------

/// Options for parse_script().
struct ParseOptions {
    /// Threads used to parse body lines.
    /// 1 = sequential, 0 = hardware_concurrency().
    unsigned int num_threads{1};
};

/// Parse a complete TeX script.
///
/// The body starts after `\clearpage` (or at the top when absent) and
/// `\end{document}` is dropped. Empty lines are skipped; a line holding only
/// whitespace is parsed like any other and fails as invalid_line.
/// @throws ParseError (missing_field) naming the first absent header field.
/// @throws ParseError for the first body line that fails to parse, with
///   the kind reported by parse_container() and the raw line in the message.
auto parse_script(std::string_view text, const ParseOptions& options = {}) -> Script;

}  // namespace lilscript_cpp
