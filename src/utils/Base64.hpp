#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rcs::utils
{

// Standard alphabet with '=' padding, as HTTP Basic credentials require.
inline std::string encode_base64(std::string_view text)
{
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((text.size() + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 3 <= text.size(); i += 3)
    {
        std::uint32_t const group =
            (static_cast<std::uint8_t>(text[i]) << 16) |
            (static_cast<std::uint8_t>(text[i + 1]) << 8) |
            static_cast<std::uint8_t>(text[i + 2]);
        encoded.push_back(kAlphabet[(group >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(group >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(group >> 6) & 0x3F]);
        encoded.push_back(kAlphabet[group & 0x3F]);
    }
    auto const rest = text.size() - i;
    if (rest > 0)
    {
        std::uint32_t group = static_cast<std::uint8_t>(text[i]) << 16;
        if (rest == 2)
        {
            group |= static_cast<std::uint8_t>(text[i + 1]) << 8;
        }
        encoded.push_back(kAlphabet[(group >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(group >> 12) & 0x3F]);
        encoded.push_back(rest == 2 ? kAlphabet[(group >> 6) & 0x3F] : '=');
        encoded.push_back('=');
    }
    return encoded;
}

// "Basic <base64(user:password)>" for an Authorization header.
inline std::string basic_authorization(std::string_view credentials)
{
    return "Basic " + encode_base64(credentials);
}

} // namespace rcs::utils
