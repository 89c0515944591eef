// lilscript: convert a TeX audio script to Markdown
//
// Usage: lilscript -i <infile.tex> -o <outfile.md> [-v] [-q] [--threads N]
//                  [--report] [--json <file.json>]
//
// Build: cmake --build build
// Run:   ./build/examples/lilscript -i script.tex -o script.md

#include <lilscript-cpp/json.hpp>
#include <lilscript-cpp/lilscript.hpp>

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <exception>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace ls = lilscript_cpp;
namespace fs = std::filesystem;

namespace {

struct Arguments {
    fs::path infile;
    fs::path outfile;
    std::optional<fs::path> json_file;
    int verbosity{0};  // +1 per -v, -1 per -q
    unsigned int num_threads{1};
    bool report{false};
};

void print_usage(const char* program) {
    std::fprintf(stderr,
        "Usage: %s -i <infile> -o <outfile> [options]\n"
        "\n"
        "  -i, --infile <path>    the input file to operate on (.tex)\n"
        "  -o, --outfile <path>   the file to output the results to (.md)\n"
        "  -v, --verbose          more diagnostics (repeatable)\n"
        "  -q, --quiet            fewer diagnostics (repeatable)\n"
        "      --threads <n>      threads for line parsing (0 = all cores)\n"
        "      --report           print the script report to stdout\n"
        "      --json <path>      also write the script as JSON\n"
        "  -h, --help             show this help\n",
        program);
}

auto parse_arguments(int argc, char** argv) -> std::optional<Arguments> {
    auto args = Arguments{};
    auto have_in = false;
    auto have_out = false;

    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        auto value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string_view{argv[++i]};
        };

        if (arg == "-i" || arg == "--infile") {
            auto v = value();
            if (!v) return std::nullopt;
            args.infile = *v;
            have_in = true;
        } else if (arg == "-o" || arg == "--outfile") {
            auto v = value();
            if (!v) return std::nullopt;
            args.outfile = *v;
            have_out = true;
        } else if (arg == "--json") {
            auto v = value();
            if (!v) return std::nullopt;
            args.json_file = fs::path{*v};
        } else if (arg == "--threads") {
            auto v = value();
            if (!v) return std::nullopt;
            const auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), args.num_threads);
            if (ec != std::errc{} || ptr != v->data() + v->size()) return std::nullopt;
        } else if (arg == "--report") {
            args.report = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-'
                   && arg.find_first_not_of("vq", 1) == std::string_view::npos) {
            // -v, -vv, -q, -qq, ...
            for (const auto c : arg.substr(1)) {
                args.verbosity += c == 'v' ? 1 : -1;
            }
        } else if (arg == "--verbose") {
            ++args.verbosity;
        } else if (arg == "--quiet") {
            --args.verbosity;
        } else {
            return std::nullopt;
        }
    }

    if (!have_in || !have_out) return std::nullopt;
    return args;
}

// info by default; each -v goes towards debug, each -q towards off.
auto level_for(int verbosity) -> ls::LogLevel {
    if (verbosity >= 1) return ls::LogLevel::debug;
    switch (verbosity) {
        case 0:  return ls::LogLevel::info;
        case -1: return ls::LogLevel::warn;
        case -2: return ls::LogLevel::error;
        default: return ls::LogLevel::off;
    }
}

auto read_file(const fs::path& path) -> std::string {
    auto ifs = std::ifstream{path, std::ios::binary};
    if (!ifs) {
        throw ls::ParseError{ls::ErrorKind::io_error, "Could not read " + path.string()};
    }
    auto ss = std::ostringstream{};
    ss << ifs.rdbuf();
    return ss.str();
}

void write_file(const fs::path& path, std::string_view contents) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!ofs) {
        throw ls::ParseError{ls::ErrorKind::io_error, "Could not write " + path.string()};
    }
}

auto run(const Arguments& args) -> void {
    const auto from = ls::format_from_path(args.infile);
    const auto to = ls::format_from_path(args.outfile);

    ls::log_debug(std::string{ls::to_string_view(from)} + " -> "
                  + std::string{ls::to_string_view(to)});
    if (!ls::is_supported(from, to)) {
        throw ls::ParseError{ls::ErrorKind::unsupported_conversion, "Only doing TeX -> Markdown"};
    }

    ls::log_debug("Reading from: " + args.infile.string());
    const auto text = read_file(args.infile);

    const auto options = ls::ParseOptions{.num_threads = args.num_threads};
    const auto script = ls::parse_script(text, options);

    ls::log_info("Title: " + script.title);
    ls::log_info("Words: " + ls::to_string(ls::word_count(script)));

    write_file(args.outfile, ls::render(script));

    if (args.report) {
        const auto report = ls::describe(script);
        std::fwrite(report.data(), 1, report.size(), stdout);
    }
    if (args.json_file) {
        write_file(*args.json_file, ls::export_json(script).dump(2) + "\n");
    }
}

}  // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    const auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage(argv[0]);
        return 2;
    }

    ls::set_log_level(level_for(args->verbosity));

    try {
        run(*args);
    } catch (const ls::ParseError& e) {
        ls::log_error(std::string{ls::to_string_view(e.kind())} + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        ls::log_error(e.what());
        return 1;
    }
    return 0;
}
