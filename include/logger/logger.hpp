#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <expected>
#include <format>

/**
 * Process-wide line logger.
 *
 * Lines are "<UTC ISO-8601 ms> [LEVEL] message". Warn and error lines go to
 * stderr, the rest to stdout. With a file configured, lines are also
 * appended there and the file rotates to "<file>.1" past max_size_mb.
 */
class Logger
{
public:
    enum class Level { Debug, Info, Warn, Error };

    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    static void shutdown();

    [[nodiscard]] static Level level() { return instance().lvl.load(std::memory_order_relaxed); }
    [[nodiscard]] static bool enabled(Level l) { return l >= level(); }

    template<typename... Args>
    static void write(Level l, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(l))
        {
            emit(l, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    [[nodiscard]] static std::expected<Level, std::string> parse_level(std::string_view lvl);

private:
    struct State
    {
        std::atomic<Level> lvl{Level::Info};
        std::mutex mtx;
        std::ofstream file;
        std::string filename;
        bool console = true;
        size_t max_size = 100 * 1024 * 1024;
        size_t written = 0;
    };

    static State& instance();
    static std::string_view level_tag(Level l);
    static void rotate(State& s);
    static void emit(Level l, std::string_view msg);
};

// Phone numbers are identity keys; only the trailing four digits reach the log.
[[nodiscard]] std::string mask_phone(std::string_view phone);

#define LOG_DEBUG(...) Logger::write(Logger::Level::Debug, __VA_ARGS__)
#define LOG_INFO(...)  Logger::write(Logger::Level::Info, __VA_ARGS__)
#define LOG_WARN(...)  Logger::write(Logger::Level::Warn, __VA_ARGS__)
#define LOG_ERROR(...) Logger::write(Logger::Level::Error, __VA_ARGS__)
