#include <lilscript-cpp/convert.hpp>
#include <lilscript-cpp/log.hpp>
#include <lilscript-cpp/markdown.hpp>

namespace lilscript_cpp {

auto format_from_path(const std::filesystem::path& path) -> FileFormat {
    if (!path.has_extension()) {
        throw ParseError{ErrorKind::unknown_format,
            "Invalid file extension: could not be determined"};
    }

    const auto ext = path.extension().string();
    if (ext == ".tex") return FileFormat::tex;
    if (ext == ".md") return FileFormat::markdown;

    throw ParseError{ErrorKind::unknown_format,
        "Invalid file extension: should be .tex / .md"};
}

auto convert(std::string_view text, FileFormat from, FileFormat to,
             const ParseOptions& options) -> std::string {
    log_debug(std::string{to_string_view(from)} + " -> " + std::string{to_string_view(to)});

    if (!is_supported(from, to)) {
        throw ParseError{ErrorKind::unsupported_conversion, "Only doing TeX -> Markdown"};
    }

    const auto script = parse_script(text, options);
    log_info("Title: " + script.title);
    log_info("Words: " + to_string(word_count(script)));
    return render(script);
}

}  // namespace lilscript_cpp
