#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace base64
{

std::string encode(std::span<const uint8_t> data);

// Strict RFC 4648 decoding: canonical padding, no whitespace, no url alphabet.
std::optional<std::vector<uint8_t>> decode(std::string_view text);

} // namespace base64
