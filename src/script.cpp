#include <lilscript-cpp/script.hpp>

#include <re2/re2.h>

#include <charconv>
#include <cstdio>

namespace lilscript_cpp {

auto SeriesEntry::parse(std::string_view value) -> SeriesEntry {
    if (value.empty() || value == "—" || value == R"(\textemdash)") {
        return SeriesEntry{};
    }

    static const re2::RE2 series_re{R"((.*?) \(Part (\d+)\))"};

    auto title = std::string{};
    auto digits = std::string{};
    if (!re2::RE2::FullMatch(value, series_re, &title, &digits)) {
        return SeriesEntry{};
    }

    // A part number too large for size_t is kept as 0.
    auto part = std::size_t{0};
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), part);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        part = 0;
    }

    return SeriesEntry{std::move(title), part};
}

auto to_string(const SeriesEntry& series) -> std::string {
    if (!series.title || !series.part) return {};
    return *series.title + " (Part " + std::to_string(*series.part) + ")";
}

auto to_string(const Character& character) -> std::string {
    return character.name + " => " + character.description;
}

auto to_string(const Date& date) -> std::string {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buf;
}

auto word_count(const Script& script) -> WordCount {
    auto total = WordCount::zero();
    for (const auto& container : script.paragraphs) {
        total += word_count(container);
    }
    return total;
}

auto describe(const Script& script) -> std::string {
    auto out = std::string{};
    auto line = [&out](std::string_view label, std::string_view value) {
        out += label;
        out += ": ";
        out += value;
        out += '\n';
    };

    line("Title", script.title);
    line("Author", script.author);
    line("Series", to_string(script.series));

    auto tags = std::string{};
    for (const auto& tag : script.tags) {
        if (!tags.empty()) tags += ' ';
        tags += '[' + tag + ']';
    }
    line("Tags", tags);

    line("Date", script.date ? to_string(*script.date) : std::string{"none"});
    line("Summary", script.summary);

    for (const auto& character : script.characters) {
        line("Character", to_string(character));
    }

    line("Words", to_string(word_count(script)));
    out += '\n';

    for (const auto& container : script.paragraphs) {
        for (std::size_t i = 0; i < container.spans.size(); ++i) {
            const auto& span = container.spans[i];
            out += i == 0 ? to_string_view(container.kind) : std::string_view{"_"};
            out += "::";
            out += to_string_view(span.kind);
            out += "(\"" + span.contents + "\")\n";
        }
    }

    return out;
}

}  // namespace lilscript_cpp
