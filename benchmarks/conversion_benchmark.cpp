// lilscript-cpp benchmarks: throughput of the conversion pipeline.

#include <lilscript-cpp/lilscript.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <string>

using namespace lilscript_cpp;

static auto make_script_text(std::size_t lines) -> std::string {
    auto text = std::string{
        "\\renewcommand{\\SceneName}{Benchmark}\n"
        "\\scriptAuthor{bench}\n"
        "\\scriptSeries{\\textemdash}\n"
        "\\scriptTags{[a][b][c]}\n"
        "\\summary{A long script.}\n"
        "\\clearpage\n"};
    for (std::size_t i = 0; i < lines; ++i) {
        switch (i % 4) {
            case 0: text += "\\spoken{Hello there\\ldots{} \\direct{softly} it's \\ul{you}, isn't it?}\n"; break;
            case 1: text += "\\stagedir{She crosses the room. \\direct{slowly}}\n"; break;
            case 2: text += "\\sfx{door creaks}\n"; break;
            default: text += "\\listener{\\direct{quietly} ``maybe'' I am}\n"; break;
        }
    }
    text += "\\end{document}\n";
    return text;
}

// =============================================================================
// Leaf operations
// =============================================================================

static void bm_normalize(benchmark::State& state) {
    const auto line = std::string{
        R"(Some text\textellipsis{} with ``quotes'' and \$5 \& a \href{https://example.com}{link}\kaosmile{})"};
    for (auto _ : state) {
        auto s = normalize(line);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_normalize);

static void bm_partition(benchmark::State& state) {
    const auto body = std::string{
        R"(Some text \direct{a cue} and more \ul{stress} then \direct{another} end.)"};
    for (auto _ : state) {
        auto parts = partition(inline_command_pattern(), body);
        benchmark::DoNotOptimize(parts);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_partition);

static void bm_count_words(benchmark::State& state) {
    const auto text = std::string{"C'est même en français, avec les accents, and some well-known English too."};
    for (auto _ : state) {
        auto n = count_words(text);
        benchmark::DoNotOptimize(n);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_count_words);

// =============================================================================
// Whole scripts
// =============================================================================

static void bm_parse_script(benchmark::State& state) {
    const auto text = make_script_text(static_cast<std::size_t>(state.range(0)));
    set_log_level(LogLevel::off);
    for (auto _ : state) {
        auto script = parse_script(text);
        benchmark::DoNotOptimize(script);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_parse_script)->Range(16, 4096);

static void bm_parse_script_parallel(benchmark::State& state) {
    const auto text = make_script_text(static_cast<std::size_t>(state.range(0)));
    set_log_level(LogLevel::off);
    for (auto _ : state) {
        auto script = parse_script(text, ParseOptions{.num_threads = 0});
        benchmark::DoNotOptimize(script);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_parse_script_parallel)->Range(16, 4096);

static void bm_render_script(benchmark::State& state) {
    set_log_level(LogLevel::off);
    const auto script = parse_script(make_script_text(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto md = render(script);
        benchmark::DoNotOptimize(md);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_render_script)->Range(16, 4096);

static void bm_word_count_script(benchmark::State& state) {
    set_log_level(LogLevel::off);
    const auto script = parse_script(make_script_text(1024));
    for (auto _ : state) {
        auto count = word_count(script);
        benchmark::DoNotOptimize(count);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_word_count_script);
