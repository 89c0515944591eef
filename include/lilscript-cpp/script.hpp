/// @file script.hpp
/// @brief The Script aggregate and its metadata types.

#pragma once

#include <lilscript-cpp/container.hpp>
#include <lilscript-cpp/word_count.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lilscript_cpp {

/// The series a script belongs to, with its part index.
struct SeriesEntry {
    std::optional<std::string> title;  ///< The title of the series.
    std::optional<std::size_t> part;   ///< The part index of this script.

    /// Parse a free-text series field.
    ///
    /// "", "—" and "\textemdash" mean "no series". Otherwise the value must
    /// end in " (Part N)"; anything else also yields an empty entry.
    /// @code
    /// auto s = SeriesEntry::parse("A Very Cool Series (Part 7)");
    /// // s.title == "A Very Cool Series", s.part == 7
    /// @endcode
    static auto parse(std::string_view value) -> SeriesEntry;

    auto operator==(const SeriesEntry&) const -> bool = default;
};

/// "Title (Part N)" when both halves are present, otherwise "".
auto to_string(const SeriesEntry& series) -> std::string;

/// A character of the script, in declaration order.
struct Character {
    std::string name;         ///< The name / header of the character.
    std::string description;  ///< The description of the character.

    auto operator==(const Character&) const -> bool = default;
};

/// "name => description".
auto to_string(const Character& character) -> std::string;

/// A calendar date with day granularity.
using Date = std::chrono::year_month_day;

/// "YYYY-MM-DD".
auto to_string(const Date& date) -> std::string;

/// A parsed script.
///
/// Produced in one piece by parse_script() and not modified afterwards.
/// `date` and `characters` are not read from the source yet and are
/// always empty after parsing.
struct Script {
    std::string author;                   ///< One string, even for several authors.
    std::string title;                    ///< The scene name.
    SeriesEntry series;                   ///< Series membership, if any.
    std::vector<std::string> tags;        ///< Tags without their brackets.
    std::optional<Date> date;             ///< The date of the script.
    std::string summary;                  ///< The summary paragraph.
    std::vector<Character> characters;    ///< Characters in display order.
    std::vector<Container> paragraphs;    ///< The body, one container per line.

    auto operator==(const Script&) const -> bool = default;
};

/// The word count of the whole script.
auto word_count(const Script& script) -> WordCount;

/// A human-readable report: metadata, word count, then one line per span.
auto describe(const Script& script) -> std::string;

}  // namespace lilscript_cpp
