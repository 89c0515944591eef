#include <lilscript-cpp/word_count.hpp>

#include <re2/re2.h>

#include <cmath>
#include <cstdio>

namespace lilscript_cpp {

namespace {

// 1234567 -> "1,234,567"
auto group_thousands(std::size_t value) -> std::string {
    auto digits = std::to_string(value);
    auto out = std::string{};
    out.reserve(digits.size() + digits.size() / 3);
    const auto lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead) out.push_back(',');
        out.push_back(digits[i]);
    }
    return out;
}

}  // namespace

auto count_words(std::string_view text) -> std::size_t {
    static const re2::RE2 word_re{"[A-Za-zÀ-ÖØ-öø-ÿ'~-]+"};

    auto input = re2::StringPiece{text};
    auto count = std::size_t{0};
    while (re2::RE2::FindAndConsume(&input, word_re)) {
        ++count;
    }
    return count;
}

auto is_spoken(const Span& span, ContainerKind context) -> bool {
    if (context != ContainerKind::spoken) return false;
    return span.kind != SpanKind::inline_direction;
}

auto word_count(const Span& span, ContainerKind context) -> WordCount {
    const auto words = count_words(span.contents);
    return is_spoken(span, context) ? WordCount::only_spoken(words)
                                    : WordCount::only_unspoken(words);
}

auto word_count(const Container& container) -> WordCount {
    auto total = WordCount::zero();
    for (const auto& span : container.spans) {
        total += word_count(span, container.kind);
    }
    return total;
}

auto to_string(const WordCount& count, int decimals) -> std::string {
    auto density = std::string{"———%"};
    if (const auto rho = count.speech_density(); !std::isnan(rho)) {
        const auto precision = decimals < 0 ? 0 : decimals;
        const auto percent = 100.0 * rho;
        const auto len = std::snprintf(nullptr, 0, "%.*f%%", precision, percent);
        density.assign(static_cast<std::size_t>(len), '\0');
        std::snprintf(density.data(), density.size() + 1, "%.*f%%", precision, percent);
    }

    return group_thousands(count.spoken) + " spoken + "
         + group_thousands(count.unspoken) + " unspoken -> "
         + group_thousands(count.total()) + " total (ρ = " + density + ")";
}

}  // namespace lilscript_cpp
