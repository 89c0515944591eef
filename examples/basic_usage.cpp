// basic_usage: demonstrates the core lilscript-cpp API
//
// Shows parsing a script from TeX, inspecting its metadata and lines,
// word counts, rendering single lines and whole scripts to Markdown,
// building containers by hand, and handling parse errors.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <lilscript-cpp/lilscript.hpp>

#include <cstdio>
#include <string>

namespace ls = lilscript_cpp;

int main() {
    const auto tex = std::string{R"(\documentclass{article}
\renewcommand{\SceneName}{A Quiet Evening}
\scriptAuthor{lilellia}
\scriptSeries{Evenings (Part 2)}
\scriptTags{[F4A][Comfort][Rain]}
\summary{A calm evening in.}
\begin{document}
\clearpage
\stagedir{Rain against the window.}
\spoken{Oh\textellipsis{} you're back. \direct{softly} Come in, it's \ul{freezing}.}
\sfx{door closes}
\listener{\direct{quietly} thanks}
\end{document}
)"};

    // -- Parse ----------------------------------------------------------------
    const auto script = ls::parse_script(tex);

    std::printf("Title:  %s\n", script.title.c_str());
    std::printf("Author: %s\n", script.author.c_str());
    std::printf("Series: %s\n", ls::to_string(script.series).c_str());
    std::printf("Tags (%zu):", script.tags.size());
    for (const auto& tag : script.tags) {
        std::printf(" [%s]", tag.c_str());
    }
    std::printf("\n");

    // -- Lines and spans ------------------------------------------------------
    for (const auto& line : script.paragraphs) {
        std::printf("%s:", std::string{ls::to_string_view(line.kind)}.c_str());
        for (const auto& span : line.spans) {
            std::printf(" %s(\"%s\")", std::string{ls::to_string_view(span.kind)}.c_str(),
                        span.contents.c_str());
        }
        std::printf("\n");
    }

    // -- Word counts ----------------------------------------------------------
    std::printf("Words: %s\n", ls::to_string(ls::word_count(script)).c_str());

    // -- Render one line built by hand ----------------------------------------
    const auto line = ls::Container{ls::ContainerKind::spoken}
        .push(ls::Span::inline_direction("quietly"))
        .push(ls::Span::normal("hi"));
    std::printf("Line: %s\n", ls::render(line).c_str());

    // -- Render the whole script ----------------------------------------------
    std::printf("\n%s\n\n", ls::render(script).c_str());

    // -- Errors ---------------------------------------------------------------
    try {
        const auto bad = ls::parse_container(R"(\spoken{hello \whisper{there}})");
        std::printf("Unexpectedly parsed: %s\n", ls::render(bad).c_str());
    } catch (const ls::ParseError& e) {
        std::printf("Error (%s): %s\n",
                    std::string{ls::to_string_view(e.kind())}.c_str(), e.what());
    }

    return 0;
}
