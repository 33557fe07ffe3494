#include "tusc/encoding/base64.hpp"

#include <cstdint>

namespace tusc::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t index = 0;
        for (; index + 3 <= data.size(); index += 3)
        {
            const auto group = (static_cast<std::uint32_t>(data[index]) << 16) |
                               (static_cast<std::uint32_t>(data[index + 1]) << 8) |
                               static_cast<std::uint32_t>(data[index + 2]);
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(kAlphabet[(group >> 6) & 0x3F]);
            output.push_back(kAlphabet[group & 0x3F]);
        }

        const auto tail = data.size() - index;
        if (tail == 1)
        {
            const auto group = static_cast<std::uint32_t>(data[index]) << 16;
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.append("==");
        }
        else if (tail == 2)
        {
            const auto group = (static_cast<std::uint32_t>(data[index]) << 16) |
                               (static_cast<std::uint32_t>(data[index + 1]) << 8);
            output.push_back(kAlphabet[(group >> 18) & 0x3F]);
            output.push_back(kAlphabet[(group >> 12) & 0x3F]);
            output.push_back(kAlphabet[(group >> 6) & 0x3F]);
            output.push_back('=');
        }

        return output;
    }

    std::string encode_base64(std::string_view text)
    {
        return encode_base64(std::as_bytes(std::span(text.data(), text.size())));
    }

} // namespace tusc::encoding
