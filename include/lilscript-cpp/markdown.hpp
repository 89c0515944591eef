/// @file markdown.hpp
/// @brief Rendering of the Script model to Markdown.

#pragma once

#include <lilscript-cpp/container.hpp>
#include <lilscript-cpp/script.hpp>
#include <lilscript-cpp/span.hpp>

#include <string>

namespace lilscript_cpp {

/// Render one span on its own.
///
/// normal -> "text", emphasis -> "/text/", inline_direction -> "*(text)*".
auto render(const Span& span) -> std::string;

/// Render one line.
///
/// Spoken lines bold their prose and keep cues unbolded. Stage directions,
/// sound effects and listener lines are quoted and italicised as a whole,
/// so the asterisks around nested cues are dropped:
/// @code
/// render(Container{ContainerKind::stage_dir}
///     .push(Span::normal("some text"))
///     .push(Span::inline_direction("loudly")));
/// // "> *[some text (loudly)]*"
/// @endcode
/// Emphasis inside a spoken line is rendered bold with a warning, since
/// it may belong to a cue rather than to the dialogue.
auto render(const Container& container) -> std::string;

/// Render the whole script: characters, the formatting guide, then one
/// block per paragraph, separated by blank lines.
auto render(const Script& script) -> std::string;

}  // namespace lilscript_cpp
