#include "service/config.hpp"
#include "logger/logger.hpp"

#include <fstream>
#include <sstream>
#include <format>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::expected<int64_t, std::string> get_int(const json::object& obj, std::string_view key,
                                            int64_t min_val, int64_t max_val, int64_t default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_uint64() && it->value().as_uint64() > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<int64_t>();
    if (val < min_val || val > max_val)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    return val;
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return &it->value().as_object();
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;

    if (const auto* keys = section(root, "keys"))
    {
        config.key.dir = get_string(*keys, "dir", ".keys");
        if (config.key.dir.empty())
        {
            return std::unexpected("'dir' must not be empty");
        }
        if (auto bits = get_uint<uint32_t>(*keys, "rsa_bits", 2048, 16384, 2048); bits)
        {
            config.key.rsa_bits = *bits;
        }
        else
        {
            return std::unexpected(bits.error());
        }
    }

    if (const auto* st = section(root, "storage"))
    {
        config.store.db_path = get_string(*st, "db_path", "mpin.db");
        if (auto days = get_uint<uint32_t>(*st, "attempt_retention_days", 1, 3650, 90); days)
        {
            config.store.attempt_retention = std::chrono::days(*days);
        }
        else
        {
            return std::unexpected(days.error());
        }
    }

    if (const auto* lo = section(root, "lockout"))
    {
        if (auto max_fail = get_uint<uint32_t>(*lo, "max_failures", 1, 100, 5); max_fail)
        {
            config.lock.max_failures = *max_fail;
        }
        else
        {
            return std::unexpected(max_fail.error());
        }
        if (auto dur = get_uint<uint64_t>(*lo, "duration_sec", 1, 86400 * 7, 1800); dur)
        {
            config.lock.duration = std::chrono::seconds(*dur);
        }
        else
        {
            return std::unexpected(dur.error());
        }
    }

    if (const auto* rk = section(root, "risk"))
    {
        if (auto window = get_uint<uint32_t>(*rk, "history_window_days", 1, 365, 30); window)
        {
            config.rsk.history_window = std::chrono::days(*window);
        }
        else
        {
            return std::unexpected(window.error());
        }
        if (auto limit = get_uint<size_t>(*rk, "history_limit", 1, 10000, 50); limit)
        {
            config.rsk.history_limit = *limit;
        }
        else
        {
            return std::unexpected(limit.error());
        }
        if (auto rapid = get_uint<uint64_t>(*rk, "rapid_window_sec", 1, 86400, 300); rapid)
        {
            config.rsk.rapid_window = std::chrono::seconds(*rapid);
        }
        else
        {
            return std::unexpected(rapid.error());
        }
        // UTC-12:00 .. UTC+14:00
        if (auto offset = get_int(*rk, "utc_offset_minutes", -720, 840, 0); offset)
        {
            config.rsk.utc_offset = std::chrono::minutes(*offset);
        }
        else
        {
            return std::unexpected(offset.error());
        }
    }

    if (const auto* ss = section(root, "session"))
    {
        config.sess.secret = get_string(*ss, "secret", "");
        if (auto ttl = get_uint<uint64_t>(*ss, "ttl_sec", 60, 86400, 900); ttl)
        {
            config.sess.ttl = std::chrono::seconds(*ttl);
        }
        else
        {
            return std::unexpected(ttl.error());
        }
        config.sess.issuer = get_string(*ss, "issuer", "SmartBank");
        config.sess.audience = get_string(*ss, "audience", "smartbank-app");
    }

    if (const auto* en = section(root, "engine"))
    {
        if (auto threads = get_uint<size_t>(*en, "cpu_threads", 0, 256, 0); threads)
        {
            config.eng.cpu_threads = *threads;
        }
        else
        {
            return std::unexpected(threads.error());
        }
    }

    if (const auto* lg = section(root, "logging"))
    {
        config.log.level = get_string(*lg, "level", "info");
        if (auto lvl = Logger::parse_level(config.log.level); !lvl)
        {
            return std::unexpected(lvl.error());
        }
        config.log.file = get_string(*lg, "file", "");
        if (auto max_size = get_uint<size_t>(*lg, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(*lg, "enable_console", true);
    }

    return config;
}
