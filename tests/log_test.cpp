#include <lilscript-cpp/log.hpp>

#include "log_capture.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace lilscript_cpp;
using lilscript_cpp::test_support::LogCapture;

TEST(LogLevel, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(LogLevel::debug), "debug");
    EXPECT_EQ(to_string_view(LogLevel::info),  "info");
    EXPECT_EQ(to_string_view(LogLevel::warn),  "warn");
    EXPECT_EQ(to_string_view(LogLevel::error), "error");
    EXPECT_EQ(to_string_view(LogLevel::off),   "off");
}

TEST(LogLevel, levels_are_ordered_by_severity) {
    EXPECT_LT(LogLevel::debug, LogLevel::info);
    EXPECT_LT(LogLevel::info, LogLevel::warn);
    EXPECT_LT(LogLevel::warn, LogLevel::error);
    EXPECT_LT(LogLevel::error, LogLevel::off);
}

TEST(Log, sink_receives_messages_at_or_above_threshold) {
    auto capture = LogCapture{LogLevel::warn};

    log_debug("d");
    log_info("i");
    log_warn("w");
    log_error("e");

    ASSERT_EQ(capture.entries().size(), 2u);
    EXPECT_EQ(capture.entries()[0].first, LogLevel::warn);
    EXPECT_EQ(capture.entries()[0].second, "w");
    EXPECT_EQ(capture.entries()[1].first, LogLevel::error);
    EXPECT_EQ(capture.entries()[1].second, "e");
}

TEST(Log, debug_threshold_lets_everything_through) {
    auto capture = LogCapture{LogLevel::debug};

    log_debug("d");
    log_info("i");

    EXPECT_EQ(capture.count(LogLevel::debug), 1u);
    EXPECT_EQ(capture.count(LogLevel::info), 1u);
}

TEST(Log, off_threshold_silences_everything) {
    auto capture = LogCapture{LogLevel::off};

    log_error("e");
    log(LogLevel::off, "never");

    EXPECT_TRUE(capture.entries().empty());
}

TEST(Log, off_is_not_a_message_level) {
    auto capture = LogCapture{LogLevel::debug};
    log(LogLevel::off, "never");
    EXPECT_TRUE(capture.entries().empty());
}

TEST(Log, threshold_is_restored_after_capture) {
    const auto before = log_level();
    {
        auto capture = LogCapture{LogLevel::off};
        EXPECT_EQ(log_level(), LogLevel::off);
    }
    EXPECT_EQ(log_level(), before);
}

TEST(Log, set_log_level_round_trips) {
    const auto before = log_level();
    set_log_level(LogLevel::error);
    EXPECT_EQ(log_level(), LogLevel::error);
    set_log_level(before);
}

TEST(Log, sink_may_log_again) {
    const auto before = log_level();
    set_log_level(LogLevel::debug);

    auto seen = std::vector<std::string>{};
    set_log_sink([&seen](LogLevel level, std::string_view message) {
        seen.emplace_back(message);
        if (level == LogLevel::error) log_info("forwarded: " + std::string{message});
    });

    log_error("boom");
    set_log_sink({});
    set_log_level(before);

    EXPECT_EQ(seen, (std::vector<std::string>{"boom", "forwarded: boom"}));
}

TEST(Log, sink_may_replace_itself) {
    auto capture = LogCapture{};
    auto calls = 0;
    set_log_sink([&calls](LogLevel, std::string_view) {
        ++calls;
        set_log_sink({});
    });

    log_warn("once");
    EXPECT_EQ(calls, 1);
}

TEST(Log, sinks_are_serialized_across_threads) {
    auto capture = LogCapture{};
    auto threads = std::vector<std::thread>{};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([] {
            for (int i = 0; i < 250; ++i) log_warn("w");
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(capture.count(LogLevel::warn), 1000u);
}
