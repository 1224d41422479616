#pragma once

#include <fmt/format.h>

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace dotsweep {

// Process-wide log sink shared by the pool threads. Lines look like
// `HH:MM:SS [tag: ]level | message`.
class Logger {
public:
    enum class Level {
        Error = 0,
        Warning,
        Info,
        Debug,
        Trace
    };

    static Logger& instance();

    void set_level(Level level) noexcept;
    Level level() const noexcept;
    bool enabled(Level level) const noexcept { return level <= level_.load(std::memory_order_relaxed); }

    template <typename... Args>
    void log(Level level, fmt::format_string<Args...> pattern, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        write(level, fmt::format(pattern, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void trace(fmt::format_string<Args...> pattern, Args&&... args) {
        log(Level::Trace, pattern, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> pattern, Args&&... args) {
        log(Level::Debug, pattern, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> pattern, Args&&... args) {
        log(Level::Info, pattern, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> pattern, Args&&... args) {
        log(Level::Warning, pattern, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> pattern, Args&&... args) {
        log(Level::Error, pattern, std::forward<Args>(args)...);
    }

    // nullptr restores std::clog. The stream must outlive its use by the logger.
    void set_output(std::ostream* stream) noexcept;
    // Prefix for every line, usually the program name. Empty disables it.
    void set_tag(std::string_view tag);

    static Level level_from_verbosity(int verbosity) noexcept;

private:
    Logger();
    void write(Level level, std::string_view message);

    std::ostream* stream_;
    std::string tag_;
    std::atomic<Level> level_;
    std::mutex mutex_;
};

} // namespace dotsweep
