// Fuzz target for parse_script(). Exercises metadata lookup, line parsing
// and rendering. Malformed input must end in ParseError, never a crash.

#include <lilscript-cpp/lilscript.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    static const bool quiet = [] {
        lilscript_cpp::set_log_level(lilscript_cpp::LogLevel::off);
        return true;
    }();
    (void)quiet;

    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto script = lilscript_cpp::parse_script(text);
        auto md = lilscript_cpp::render(script);
        auto report = lilscript_cpp::describe(script);
        (void)md;
        (void)report;
    } catch (const lilscript_cpp::ParseError&) {
        // rejected input is an expected outcome
    }
    return 0;
}
