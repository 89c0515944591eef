#include <lilscript-cpp/log.hpp>

#include <atomic>
#include <cstdio>
#include <mutex>
#include <utility>

namespace lilscript_cpp {

namespace {

void write_stderr(LogLevel level, std::string_view message) {
    const auto name = to_string_view(level);
    std::fprintf(stderr, "[%.*s] %.*s\n",
                 static_cast<int>(name.size()), name.data(),
                 static_cast<int>(message.size()), message.data());
}

struct LogState {
    std::atomic<LogLevel> level{LogLevel::warn};
    // recursive so a sink may log or swap the sink itself
    std::recursive_mutex mutex;
    LogSink sink{write_stderr};
};

auto state() -> LogState& {
    static auto s = LogState{};
    return s;
}

}  // namespace

void set_log_level(LogLevel level) {
    state().level.store(level, std::memory_order_relaxed);
}

auto log_level() -> LogLevel {
    return state().level.load(std::memory_order_relaxed);
}

void set_log_sink(LogSink sink) {
    auto& s = state();
    auto lock = std::scoped_lock{s.mutex};
    s.sink = sink ? std::move(sink) : LogSink{write_stderr};
}

void log(LogLevel level, std::string_view message) {
    auto& s = state();
    if (level == LogLevel::off || level < s.level.load(std::memory_order_relaxed)) {
        return;
    }
    auto lock = std::scoped_lock{s.mutex};
    const auto sink = s.sink;
    sink(level, message);
}

}  // namespace lilscript_cpp
