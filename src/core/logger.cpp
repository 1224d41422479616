#include "dotsweep/logger.h"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <iterator>

namespace dotsweep {

namespace {
constexpr std::string_view kLevelNames[] = {"error", "warn", "info", "debug", "trace"};

std::string_view level_name(Logger::Level level) {
    const auto index = static_cast<std::size_t>(level);
    return index < std::size(kLevelNames) ? kLevelNames[index] : "unknown";
}
} // namespace

Logger::Logger()
    : stream_{&std::clog}, level_{Level::Warning} {}

Logger& Logger::instance() {
    // Never destroyed: workers abandoned after an interrupt may still log
    // while static objects are being torn down.
    static Logger* logger = new Logger;
    return *logger;
}

void Logger::set_level(Level level) noexcept {
    level_.store(level, std::memory_order_relaxed);
}

Logger::Level Logger::level() const noexcept {
    return level_.load(std::memory_order_relaxed);
}

void Logger::set_output(std::ostream* stream) noexcept {
    std::scoped_lock lock{mutex_};
    stream_ = stream != nullptr ? stream : &std::clog;
}

void Logger::set_tag(std::string_view tag) {
    std::scoped_lock lock{mutex_};
    tag_.assign(tag.begin(), tag.end());
}

Logger::Level Logger::level_from_verbosity(int verbosity) noexcept {
    if (verbosity < 0) {
        return Level::Error;
    }
    const int warning = static_cast<int>(Level::Warning);
    const int trace = static_cast<int>(Level::Trace);
    return static_cast<Level>(std::min(warning + verbosity, trace));
}

void Logger::write(Level level, std::string_view message) {
    const auto seconds = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif

    std::scoped_lock lock{mutex_};
    auto& out = *stream_;
    out << std::put_time(&tm, "%H:%M:%S") << ' ';
    if (!tag_.empty()) {
        out << tag_ << ": ";
    }
    out << level_name(level) << " | " << message << '\n';
    if (level == Level::Error) {
        out.flush();
    }
}

} // namespace dotsweep
