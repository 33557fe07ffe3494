#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace tusc::encoding
{

    // Standard alphabet with '=' padding, as required by Upload-Metadata values.
    std::string encode_base64(std::span<const std::byte> data);

    std::string encode_base64(std::string_view text);

} // namespace tusc::encoding
