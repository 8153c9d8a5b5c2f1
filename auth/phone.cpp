#include "auth/phone.hpp"

#include <ranges>

namespace auth
{

std::expected<std::string, std::string> normalize_phone(std::string_view raw)
{
    auto digits = raw
        | std::views::filter([](char c) { return c >= '0' && c <= '9'; })
        | std::ranges::to<std::string>();

    if (digits.size() < phone_min_digits || digits.size() > phone_max_digits)
    {
        return std::unexpected("Invalid phone number");
    }
    return digits;
}

}
