#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace auth
{

constexpr size_t phone_min_digits = 10;
constexpr size_t phone_max_digits = 15;

// Strips every non-digit; the remainder must be 10 to 15 digits long.
[[nodiscard]] std::expected<std::string, std::string> normalize_phone(std::string_view raw);

}
