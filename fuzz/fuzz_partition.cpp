// Fuzz target for partition(). Every input must be reproduced exactly by
// joining its segments, and normalize() must never fail.

#include <lilscript-cpp/tex.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto joined = std::string{};
    for (const auto segment : lilscript_cpp::partition(lilscript_cpp::inline_command_pattern(), text)) {
        joined += segment;
    }
    if (joined != text) std::abort();

    auto normalized = lilscript_cpp::normalize(text);
    (void)normalized;

    return 0;
}
