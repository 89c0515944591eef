#include <lilscript-cpp/markdown.hpp>
#include <lilscript-cpp/log.hpp>

#include <re2/re2.h>

#include <cstddef>
#include <string_view>
#include <vector>

namespace lilscript_cpp {

namespace {

auto collapse_spaces(std::string s) -> std::string {
    static const re2::RE2 space_re{R"([[:space:]]+)"};
    re2::RE2::GlobalReplace(&s, space_re, " ");

    const auto first = s.find_first_not_of(' ');
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(' ');
    return s.substr(first, last - first + 1);
}

auto strip_asterisks(std::string s) -> std::string {
    const auto first = s.find_first_not_of('*');
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of('*');
    return s.substr(first, last - first + 1);
}

// The rendering of one span inside a container of the given kind.
auto render_in(const Span& span, const Container& container) -> std::string {
    switch (container.kind) {
        case ContainerKind::plain_text:
            return render(span);

        case ContainerKind::stage_dir:
        case ContainerKind::sfx:
        case ContainerKind::listener_dialogue:
            // the whole block is already italic: > *[text (cue)]*
            if (span.kind == SpanKind::inline_direction) {
                return strip_asterisks(render(span));
            }
            return render(span);

        case ContainerKind::spoken:
            switch (span.kind) {
                case SpanKind::normal:
                    return "**" + render(span) + "**";
                case SpanKind::emphasis: {
                    auto md = render(span);
                    log_warn("The emphasised span \"" + md + "\" occurs within the scope of a "
                             "spoken line and has been rendered as spoken. However, it MAY occur "
                             "within an inline direction, etc., but we do not know. Context: \""
                             + container.plain_text() + "\"");
                    return "**" + md + "**";
                }
                case SpanKind::inline_direction:
                    return render(span);
            }
            break;
    }
    return render(span);
}

}  // namespace

auto render(const Span& span) -> std::string {
    switch (span.kind) {
        case SpanKind::normal:           return span.contents;
        case SpanKind::emphasis:         return "/" + span.contents + "/";
        case SpanKind::inline_direction: return "*(" + span.contents + ")*";
    }
    return span.contents;
}

auto render(const Container& container) -> std::string {
    auto buf = std::string{};
    for (const auto& span : container.spans) {
        buf += ' ';
        buf += render_in(span, container);
        buf += ' ';
    }
    buf = collapse_spaces(std::move(buf));

    switch (container.kind) {
        case ContainerKind::plain_text:
        case ContainerKind::spoken:
            return buf;
        case ContainerKind::stage_dir:
            return "> *[" + buf + "]*";
        case ContainerKind::sfx:
            return "> *[sfx: " + buf + "]*";
        case ContainerKind::listener_dialogue:
            return "> *« " + buf + " »*";
    }
    return buf;
}

auto render(const Script& script) -> std::string {
    constexpr auto divider = std::string_view{"--8<--"};

    auto blocks = std::vector<std::string>{};

    // NOTE: the script metadata header is not part of the output
    blocks.emplace_back("## Characters");
    for (const auto& character : script.characters) {
        blocks.push_back("- **" + character.name + "** ∼ " + character.description);
    }

    blocks.emplace_back("## Formatting guide");
    blocks.push_back(render(Container{ContainerKind::spoken}
        .push(Span::normal("spoken text"))));
    blocks.push_back(render(Container{ContainerKind::spoken}
        .push(Span::emphasis("emphasis"))));
    blocks.push_back(render(Container{ContainerKind::spoken}
        .push(Span::inline_direction("tone cue, suggested"))));
    blocks.push_back(render(Container{ContainerKind::stage_dir}
        .push(Span::normal("stage direction and/or sfx"))));
    blocks.push_back(render(Container{ContainerKind::listener_dialogue}
        .push(Span::normal("example listener dialogue, not intended to be voiced"))));
    blocks.push_back(render(Container{ContainerKind::plain_text}
        .push(Span::normal(std::string{divider}))));

    for (const auto& container : script.paragraphs) {
        blocks.push_back(render(container));
    }

    auto out = std::string{};
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i != 0) out += "\n\n";
        out += blocks[i];
    }
    return out;
}

}  // namespace lilscript_cpp
