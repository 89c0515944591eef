/// @file container.hpp
/// @brief Container types: ContainerKind and Container (one script line).

#pragma once

#include <lilscript-cpp/span.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lilscript_cpp {

/// The closed set of line kinds.
enum class ContainerKind : std::uint8_t {
    spoken,             ///< Voiced dialogue (`\spoken{...}`).
    stage_dir,          ///< A stage direction (`\stagedir{...}`).
    sfx,                ///< A sound effect (`\sfx{...}`).
    listener_dialogue,  ///< Unvoiced listener lines (`\listener{...}`).
    plain_text,         ///< Anything else.
};

/// Convert a ContainerKind to its string representation.
constexpr auto to_string_view(ContainerKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ContainerKind::spoken:            return "Spoken";
        case ContainerKind::stage_dir:         return "StageDir";
        case ContainerKind::sfx:               return "Sfx";
        case ContainerKind::listener_dialogue: return "ListenerDialogue";
        case ContainerKind::plain_text:        return "PlainText";
    }
    return "Unknown";
}

/// One logical line of a script: a kind and its spans in source order.
///
/// @code
/// auto line = Container{ContainerKind::spoken}
///     .push(Span::inline_direction("quietly"))
///     .push(Span::normal("hi"));
/// @endcode
struct Container {
    ContainerKind kind{ContainerKind::plain_text};  ///< The kind of line.
    std::vector<Span> spans;                        ///< Spans in source order.

    Container() = default;

    /// Construct an empty container of the given kind.
    explicit Container(ContainerKind k) : kind{k} {}

    /// Construct a container from a kind and its spans.
    Container(ContainerKind k, std::vector<Span> s)
        : kind{k}, spans{std::move(s)} {}

    /// Append a span and return this container for chaining.
    auto push(Span span) & -> Container& {
        spans.push_back(std::move(span));
        return *this;
    }

    /// Append a span to a temporary container.
    auto push(Span span) && -> Container&& {
        spans.push_back(std::move(span));
        return std::move(*this);
    }

    auto size() const -> std::size_t { return spans.size(); }
    auto empty() const -> bool { return spans.empty(); }

    /// The span contents joined by single spaces, ignoring formatting.
    auto plain_text() const -> std::string {
        auto out = std::string{};
        for (const auto& span : spans) {
            if (&span != &spans.front()) out.push_back(' ');
            out += span.contents;
        }
        return out;
    }

    auto operator==(const Container&) const -> bool = default;
};

}  // namespace lilscript_cpp
