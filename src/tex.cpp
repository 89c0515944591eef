#include <lilscript-cpp/tex.hpp>
#include <lilscript-cpp/log.hpp>

#include "thread_pool.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <utility>

namespace lilscript_cpp {

namespace {

constexpr auto metadata_fields = std::array{
    MetadataField::title,
    MetadataField::author,
    MetadataField::series,
    MetadataField::tags,
    MetadataField::summary,
};

// The command whose argument holds each field.
constexpr auto metadata_command(MetadataField field) -> std::string_view {
    switch (field) {
        case MetadataField::title:   return R"(renewcommand{\SceneName})";
        case MetadataField::author:  return "scriptAuthor";
        case MetadataField::series:  return "scriptSeries";
        case MetadataField::tags:    return "scriptTags";
        case MetadataField::summary: return "summary";
    }
    return {};
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
    auto pos = std::size_t{0};
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

auto trim(std::string_view s) -> std::string_view {
    constexpr auto ws = std::string_view{" \t\n\r\f\v"};
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

auto to_view(re2::StringPiece piece) -> std::string_view {
    return std::string_view{piece.data(), piece.size()};
}

// `\name{value}` with `name` quoted literally; the value stops at the first `}`.
auto command_value_pattern(std::string_view command) -> std::string {
    return R"(\\)" + re2::RE2::QuoteMeta(re2::StringPiece{command}) + R"(\{(.*?)\})";
}

// Compiled once for every header field.
auto metadata_table() -> const std::array<std::unique_ptr<const re2::RE2>, metadata_fields.size()>& {
    static const auto table = [] {
        auto t = std::array<std::unique_ptr<const re2::RE2>, metadata_fields.size()>{};
        for (const auto field : metadata_fields) {
            t[static_cast<std::size_t>(field)] =
                std::make_unique<const re2::RE2>(command_value_pattern(metadata_command(field)));
        }
        return t;
    }();
    return table;
}

auto container_kind(std::string_view command) -> ContainerKind {
    static constexpr auto kinds = std::array<std::pair<std::string_view, ContainerKind>, 4>{{
        {"spoken",   ContainerKind::spoken},
        {"stagedir", ContainerKind::stage_dir},
        {"listener", ContainerKind::listener_dialogue},
        {"sfx",      ContainerKind::sfx},
    }};

    for (const auto& [name, kind] : kinds) {
        if (name == command) return kind;
    }

    log_warn("Could not identify container kind for command: " + std::string{command});
    return ContainerKind::plain_text;
}

auto parse_body_line(std::string_view line) -> Container {
    try {
        return parse_container(line);
    } catch (const ParseError& e) {
        throw ParseError{e.kind(),
            "Could not parse line: \"" + std::string{line} + "\" via: " + e.what()};
    }
}

}  // namespace

// -- Normalizer ---------------------------------------------------------------

auto normalize(std::string_view text) -> std::string {
    static const re2::RE2 quotes_re{R"(``(.*?)'')"};
    static const re2::RE2 escaped_re{R"(\\([%&$]))"};
    static const re2::RE2 kaosmile_re{R"(\\kaosmile(\{\})?)"};
    static const re2::RE2 tilde_re{R"(\\Tilde(\{\})?)"};
    static const re2::RE2 href_re{R"(\\href\{(.*?)\}\{(.*?)\})"};
    static const re2::RE2 space_re{R"([[:space:]]+)"};

    auto s = std::string{text};

    // ellipses, with or without a trailing space
    replace_all(s, R"(\ldots{})", "... ");
    replace_all(s, R"(\ldots)", "...");
    replace_all(s, R"(\textellipsis{})", "... ");
    replace_all(s, R"(\textellipsis)", "...");

    re2::RE2::GlobalReplace(&s, quotes_re, R"("\1")");
    re2::RE2::GlobalReplace(&s, escaped_re, R"(\1)");
    re2::RE2::GlobalReplace(&s, kaosmile_re, "^_^ ");
    re2::RE2::GlobalReplace(&s, tilde_re, "∼");
    re2::RE2::GlobalReplace(&s, href_re, R"([\2](\1))");
    re2::RE2::GlobalReplace(&s, space_re, " ");

    return std::string{trim(s)};
}

// -- Partitioner --------------------------------------------------------------

auto partition(const re2::RE2& pattern, std::string_view text)
    -> std::vector<std::string_view> {
    auto segments = std::vector<std::string_view>{};
    const auto input = re2::StringPiece{text};

    auto last_end = std::size_t{0};  // end of the previous match
    auto search = std::size_t{0};    // where the next search starts
    auto match = re2::StringPiece{};

    while (search <= text.size()
           && pattern.Match(input, search, text.size(), re2::RE2::UNANCHORED, &match, 1)) {
        const auto start = static_cast<std::size_t>(match.data() - input.data());
        const auto end = start + match.size();

        segments.push_back(text.substr(last_end, start - last_end));
        segments.push_back(text.substr(start, match.size()));

        last_end = end;
        // an empty match must still make progress
        search = match.empty() ? end + 1 : end;
    }

    if (last_end < text.size()) {
        segments.push_back(text.substr(last_end));
    }
    return segments;
}

auto inline_command_pattern() -> const re2::RE2& {
    static const re2::RE2 pattern{R"(\\.+?\{.*?\})"};
    return pattern;
}

// -- Spans and containers -----------------------------------------------------

auto parse_span(std::string_view fragment) -> Span {
    static const re2::RE2 command_re{R"(\\(.+)\{(.*)\})"};

    auto text = normalize(fragment);
    auto command = std::string{};
    auto argument = std::string{};

    if (!re2::RE2::PartialMatch(text, command_re, &command, &argument)) {
        return Span::normal(std::move(text));
    }

    if (command == "direct") return Span::inline_direction(normalize(trim(argument)));
    if (command == "ul") return Span::emphasis(normalize(trim(argument)));

    throw ParseError{ErrorKind::unknown_inline_command,
        "Unknown inline command \"\\" + command + "\" in span: " + text};
}

auto parse_container(std::string_view line) -> Container {
    static const re2::RE2 line_re{R"(\\(.*?)\{(.*)\})"};

    const auto text = normalize(line);
    auto command = std::string{};
    auto body = re2::StringPiece{};

    if (!re2::RE2::FullMatch(text, line_re, &command, &body)) {
        throw ParseError{ErrorKind::invalid_line, "Invalid tex line: " + text};
    }

    auto container = Container{container_kind(command)};

    // body may look like "Some text \direct{a cue} more text"
    for (const auto fragment : partition(inline_command_pattern(), to_view(body))) {
        if (fragment.empty()) continue;

        try {
            container.push(parse_span(fragment));
        } catch (const ParseError& e) {
            throw ParseError{e.kind(),
                "Could not parse span \"" + std::string{fragment} + "\" in line \""
                + text + "\": " + e.what()};
        }
    }

    return container;
}

// -- Metadata -----------------------------------------------------------------

auto find_metadata(MetadataField field, std::string_view text)
    -> std::optional<std::string_view> {
    const auto& pattern = *metadata_table()[static_cast<std::size_t>(field)];
    auto value = re2::StringPiece{};
    if (!re2::RE2::PartialMatch(text, pattern, &value)) return std::nullopt;
    return to_view(value);
}

auto search_command(std::string_view command, std::string_view text)
    -> std::optional<std::string_view> {
    const auto pattern = re2::RE2{command_value_pattern(command)};
    if (!pattern.ok()) return std::nullopt;

    auto value = re2::StringPiece{};
    if (!re2::RE2::PartialMatch(text, pattern, &value)) return std::nullopt;
    return to_view(value);
}

auto parse_tags(std::string_view value) -> std::vector<std::string> {
    static const re2::RE2 tag_re{R"(\[(.*?)\])"};

    auto tags = std::vector<std::string>{};
    auto input = re2::StringPiece{value};
    auto tag = std::string{};
    while (re2::RE2::FindAndConsume(&input, tag_re, &tag)) {
        tags.push_back(tag);
    }
    return tags;
}

// -- Script -------------------------------------------------------------------

auto parse_script(std::string_view text, const ParseOptions& options) -> Script {
    auto require = [text](MetadataField field) -> std::string_view {
        if (auto value = find_metadata(field, text)) return *value;

        auto err = Error{ErrorKind::missing_field,
            "Could not find " + std::string{to_string_view(field)}};
        err.field = std::string{to_string_view(field)};
        throw ParseError{std::move(err)};
    };

    auto script = Script{};
    script.title = std::string{require(MetadataField::title)};
    script.author = std::string{require(MetadataField::author)};
    script.series = SeriesEntry::parse(require(MetadataField::series));
    script.tags = parse_tags(require(MetadataField::tags));
    script.summary = std::string{require(MetadataField::summary)};

    constexpr auto clearpage = std::string_view{R"(\clearpage)"};
    const auto marker = text.find(clearpage);
    const auto start = marker == std::string_view::npos ? 0 : marker + clearpage.size();

    auto body = std::string{text.substr(start)};
    replace_all(body, R"(\end{document})", "");

    auto lines = std::vector<std::string_view>{};
    auto rest = std::string_view{body};
    while (!rest.empty()) {
        const auto nl = rest.find('\n');
        const auto line = rest.substr(0, nl);
        if (!line.empty()) lines.push_back(line);
        if (nl == std::string_view::npos) break;
        rest.remove_prefix(nl + 1);
    }

    const auto threads = detail::ThreadPool::resolve_threads(options.num_threads, lines.size());
    log_debug("Parsing " + std::to_string(lines.size()) + " body lines on "
              + std::to_string(threads) + " thread(s)");

    if (threads <= 1) {
        script.paragraphs.reserve(lines.size());
        for (const auto line : lines) {
            script.paragraphs.push_back(parse_body_line(line));
        }
        return script;
    }

    script.paragraphs.resize(lines.size());
    auto pool = detail::ThreadPool{threads};
    pool.parallel_for(lines.size(), [&](std::size_t i) {
        script.paragraphs[i] = parse_body_line(lines[i]);
    });
    return script;
}

}  // namespace lilscript_cpp
