/// @file word_count.hpp
/// @brief WordCount and the spoken/unspoken word classification.

#pragma once

#include <lilscript-cpp/container.hpp>
#include <lilscript-cpp/span.hpp>

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>

namespace lilscript_cpp {

/// Spoken and unspoken word totals.
///
/// WordCount values form a commutative monoid under addition with
/// WordCount::zero() as the identity.
struct WordCount {
    std::size_t spoken{0};    ///< Words that are voiced.
    std::size_t unspoken{0};  ///< Everything else.

    static constexpr auto zero() -> WordCount { return WordCount{}; }
    static constexpr auto only_spoken(std::size_t words) -> WordCount {
        return WordCount{words, 0};
    }
    static constexpr auto only_unspoken(std::size_t words) -> WordCount {
        return WordCount{0, words};
    }

    constexpr auto total() const -> std::size_t { return spoken + unspoken; }

    /// Fraction of words that are spoken; NaN when total() is zero.
    auto speech_density() const -> double {
        if (total() == 0) return std::numeric_limits<double>::quiet_NaN();
        return static_cast<double>(spoken) / static_cast<double>(total());
    }

    constexpr auto operator+=(const WordCount& other) -> WordCount& {
        spoken += other.spoken;
        unspoken += other.unspoken;
        return *this;
    }

    auto operator==(const WordCount&) const -> bool = default;
};

constexpr auto operator+(WordCount lhs, const WordCount& rhs) -> WordCount {
    lhs += rhs;
    return lhs;
}

/// Count the words in a piece of text.
///
/// A word is a maximal run of Latin letters (including the Latin-1
/// accented letters), apostrophes, tildes and hyphens. Other scripts are
/// not counted at all.
auto count_words(std::string_view text) -> std::size_t;

/// True iff the span is voiced inside a container of the given kind.
auto is_spoken(const Span& span, ContainerKind context) -> bool;

/// The words of one span, routed wholly into one bucket.
auto word_count(const Span& span, ContainerKind context) -> WordCount;

/// The words of one container.
auto word_count(const Container& container) -> WordCount;

/// Render a WordCount as
/// "1,234 spoken + 56 unspoken -> 1,290 total (ρ = 95.66%)".
/// The density placeholder "———%" is used when there are no words.
auto to_string(const WordCount& count, int decimals = 2) -> std::string;

}  // namespace lilscript_cpp
