/// @file json.hpp
/// @brief nlohmann/json export of the Script model.

#pragma once

#include <lilscript-cpp/container.hpp>
#include <lilscript-cpp/script.hpp>
#include <lilscript-cpp/span.hpp>
#include <lilscript-cpp/word_count.hpp>

#include <nlohmann/json.hpp>

namespace lilscript_cpp {

// -- ADL serialization --------------------------------------------------------

void to_json(nlohmann::json& j, SpanKind kind);
void to_json(nlohmann::json& j, ContainerKind kind);
void to_json(nlohmann::json& j, const Span& span);
void to_json(nlohmann::json& j, const Container& container);
void to_json(nlohmann::json& j, const WordCount& count);
void to_json(nlohmann::json& j, const SeriesEntry& series);
void to_json(nlohmann::json& j, const Character& character);

// -- Script export ------------------------------------------------------------

/// Export a script as a JSON object.
///
/// Keys: title, author, series, tags, date, summary, characters,
/// word_count and paragraphs. Absent values become null; the density is
/// null when the script has no words.
auto export_json(const Script& script) -> nlohmann::json;

}  // namespace lilscript_cpp
