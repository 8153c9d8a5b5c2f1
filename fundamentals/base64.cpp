#include "fundamentals/base64.hpp"

#include <openssl/evp.h>
#include <algorithm>

namespace base64
{

namespace
{

bool is_alphabet(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

}

std::string encode(std::span<const uint8_t> data)
{
    if (data.empty())
    {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(std::max(len, 0)));
    return out;
}

std::optional<std::vector<uint8_t>> decode(std::string_view text)
{
    if (text.empty() || text.size() % 4 != 0)
    {
        return std::nullopt;
    }

    size_t pad = 0;
    if (text.back() == '=')
    {
        pad = text[text.size() - 2] == '=' ? 2 : 1;
    }

    auto body = text.substr(0, text.size() - pad);
    if (!std::ranges::all_of(body, is_alphabet))
    {
        return std::nullopt;
    }

    std::vector<uint8_t> out(3 * (text.size() / 4));
    int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if (len < 0 || static_cast<size_t>(len) < pad)
    {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(len) - pad);
    return out;
}

} // namespace base64
