/// @file span.hpp
/// @brief Span types: SpanKind and Span, the atomic unit of a script.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace lilscript_cpp {

/// The closed set of span kinds.
///
/// The kind decides both how a span is rendered and whether its words
/// count as spoken.
enum class SpanKind : std::uint8_t {
    normal,            ///< Plain prose.
    emphasis,          ///< Underlined / stressed text (`\ul{...}`).
    inline_direction,  ///< A parenthetical performance cue (`\direct{...}`).
};

/// Convert a SpanKind to its string representation.
constexpr auto to_string_view(SpanKind kind) noexcept -> std::string_view {
    switch (kind) {
        case SpanKind::normal:           return "Normal";
        case SpanKind::emphasis:         return "Emphasis";
        case SpanKind::inline_direction: return "InlineDirection";
    }
    return "Unknown";
}

/// A run of text tagged with its kind.
struct Span {
    SpanKind kind{SpanKind::normal};  ///< What this text is.
    std::string contents;             ///< The text, already normalized.

    /// Construct a span of kind normal.
    static auto normal(std::string contents) -> Span {
        return Span{SpanKind::normal, std::move(contents)};
    }

    /// Construct a span of kind emphasis.
    static auto emphasis(std::string contents) -> Span {
        return Span{SpanKind::emphasis, std::move(contents)};
    }

    /// Construct a span of kind inline_direction.
    static auto inline_direction(std::string contents) -> Span {
        return Span{SpanKind::inline_direction, std::move(contents)};
    }

    /// Copy of this span with a different kind.
    auto as_kind(SpanKind k) const -> Span { return Span{k, contents}; }

    auto operator==(const Span&) const -> bool = default;
};

}  // namespace lilscript_cpp
