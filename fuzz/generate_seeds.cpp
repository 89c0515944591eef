// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, only a corpus generator.

#include <lilscript-cpp/lilscript.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

static auto header(std::string_view series, std::string_view tags) -> std::string {
    return std::string{"\\renewcommand{\\SceneName}{Seed}\n\\scriptAuthor{fuzz}\n\\scriptSeries{"}
         + std::string{series} + "}\n\\scriptTags{" + std::string{tags}
         + "}\n\\summary{A seed.}\n\\clearpage\n";
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: minimal script with one spoken line
    write_seed(dir + "/seed_minimal.tex",
               header("\\textemdash", "") + "\\spoken{Hello.}\n\\end{document}\n");

    // Seed 2: every container kind
    write_seed(dir + "/seed_kinds.tex",
               header("Series (Part 3)", "[a][b]")
               + "\\spoken{Hi.}\n\\stagedir{A room.}\n\\sfx{thunk}\n"
                 "\\listener{what?}\n\\aside{plain}\n\\end{document}\n");

    // Seed 3: inline commands and normalizer idioms
    write_seed(dir + "/seed_inline.tex",
               header("", "[x]")
               + "\\spoken{Well\\ldots{} \\direct{softly} ``that's'' \\ul{it} \\$5 \\& "
                 "\\href{https://example.com}{here}\\kaosmile{}\\Tilde}\n\\end{document}\n");

    // Seed 4: missing metadata
    write_seed(dir + "/seed_missing_author.tex",
               "\\renewcommand{\\SceneName}{X}\n\\clearpage\n\\spoken{a}\n");

    // Seed 5: unknown inline command
    write_seed(dir + "/seed_bad_inline.tex",
               header("—", "[t]") + "\\spoken{a \\whisper{b} c}\n");

    return 0;
}
