#include "logger/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace
{

std::string utc_now()
{
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

}

Logger::State& Logger::instance()
{
    static State s;
    return s;
}

std::expected<Logger::Level, std::string> Logger::parse_level(std::string_view lvl)
{
    std::string lower;
    lower.reserve(lvl.size());
    std::ranges::transform(lvl, std::back_inserter(lower),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return std::unexpected(std::format("Unknown log level: {}", lvl));
}

std::string_view Logger::level_tag(Level l)
{
    switch (l)
    {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

std::expected<void, std::string> Logger::init(std::string_view level,
                                               std::string_view file,
                                               size_t max_size_mb,
                                               bool enable_console)
{
    auto lvl = parse_level(level);
    if (!lvl)
    {
        return std::unexpected(lvl.error());
    }

    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open())
    {
        s.file.close();
    }

    s.lvl.store(*lvl, std::memory_order_relaxed);
    s.console = enable_console;
    s.max_size = max_size_mb * 1024 * 1024;
    s.filename = std::string(file);
    s.written = 0;

    if (s.filename.empty())
    {
        return {};
    }

    s.file.open(s.filename, std::ios::app);
    if (!s.file.is_open())
    {
        return std::unexpected(std::format("Failed to open log file: {}", s.filename));
    }

    std::error_code ec;
    auto existing = fs::file_size(s.filename, ec);
    s.written = ec ? 0 : static_cast<size_t>(existing);
    return {};
}

void Logger::shutdown()
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.file.close();
}

// Caller holds s.mtx
void Logger::rotate(State& s)
{
    s.file.close();
    std::error_code ec;
    fs::rename(s.filename, s.filename + ".1", ec);
    s.file.open(s.filename, std::ios::trunc);
    s.written = 0;
    if (ec && s.console)
    {
        std::cerr << std::format("{} [ERROR] Log rotation failed: {}\n", utc_now(), ec.message());
    }
}

void Logger::emit(Level l, std::string_view msg)
{
    std::string line = std::format("{} [{}] {}\n", utc_now(), level_tag(l), msg);

    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.console)
    {
        auto& out = (l >= Level::Warn) ? std::cerr : std::cout;
        out << line;
    }
    if (s.file.is_open())
    {
        if (s.max_size > 0 && s.written + line.size() > s.max_size)
        {
            rotate(s);
        }
        s.file << line;
        s.file.flush();
        s.written += line.size();
    }
}

std::string mask_phone(std::string_view phone)
{
    if (phone.size() <= 4)
    {
        return std::string(phone.size(), '*');
    }
    return std::string(phone.size() - 4, '*') + std::string(phone.substr(phone.size() - 4));
}
