#pragma once
#include <boost/json.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <format>

namespace json_utils
{

inline boost::json::object result_msg(bool success, std::string_view msg)
{
    return boost::json::object{
        {"success", success},
        {"message", msg}
    };
}

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return static_cast<std::string>(it->value().as_string());
}

// Missing or non-string fields read as empty.
inline std::string optional_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return {};
    }
    return static_cast<std::string>(it->value().as_string());
}

inline bool optional_bool(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    return it != obj.end() && it->value().is_bool() && it->value().as_bool();
}

} // namespace json_utils
