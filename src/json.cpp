#include <lilscript-cpp/json.hpp>

#include <cmath>
#include <string>

namespace lilscript_cpp {

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, SpanKind kind) {
    j = std::string{to_string_view(kind)};
}

void to_json(nlohmann::json& j, ContainerKind kind) {
    j = std::string{to_string_view(kind)};
}

void to_json(nlohmann::json& j, const Span& span) {
    j = nlohmann::json{{"kind", span.kind}, {"contents", span.contents}};
}

void to_json(nlohmann::json& j, const Container& container) {
    j = nlohmann::json{{"kind", container.kind}, {"spans", container.spans}};
}

void to_json(nlohmann::json& j, const WordCount& count) {
    j = nlohmann::json{
        {"spoken", count.spoken},
        {"unspoken", count.unspoken},
        {"total", count.total()},
    };
    const auto density = count.speech_density();
    j["density"] = std::isnan(density) ? nlohmann::json(nullptr) : nlohmann::json(density);
}

void to_json(nlohmann::json& j, const SeriesEntry& series) {
    j = nlohmann::json::object();
    j["title"] = series.title ? nlohmann::json(*series.title) : nlohmann::json(nullptr);
    j["part"] = series.part ? nlohmann::json(*series.part) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const Character& character) {
    j = nlohmann::json{{"name", character.name}, {"description", character.description}};
}

// =============================================================================
// Script export
// =============================================================================

auto export_json(const Script& script) -> nlohmann::json {
    auto j = nlohmann::json::object();
    j["title"] = script.title;
    j["author"] = script.author;
    j["series"] = script.series;
    j["tags"] = script.tags;
    j["date"] = script.date ? nlohmann::json(to_string(*script.date)) : nlohmann::json(nullptr);
    j["summary"] = script.summary;
    j["characters"] = script.characters;
    j["word_count"] = word_count(script);
    j["paragraphs"] = script.paragraphs;
    return j;
}

}  // namespace lilscript_cpp
