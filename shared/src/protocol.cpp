#include "tusc/protocol.hpp"

#include <algorithm>

#include "tusc/encoding/base64.hpp"

namespace tusc::protocol
{

    namespace
    {

        std::string_view trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = input.find_last_not_of(" \t");
            return input.substr(begin, end - begin + 1);
        }

    } // namespace

    std::string encode_metadata(const std::vector<std::pair<std::string, std::string>> &metadata)
    {
        std::string result;
        for (const auto &[key, value] : metadata)
        {
            if (!result.empty())
            {
                result.push_back(',');
            }
            result.append(key);
            if (!value.empty())
            {
                result.push_back(' ');
                result.append(encoding::encode_base64(value));
            }
        }
        return result;
    }

    http::HeaderMap merge_headers(const http::HeaderMap &caller, const http::HeaderMap &mandated)
    {
        http::HeaderMap merged;
        for (const auto &[name, value] : caller)
        {
            if (mandated.find(name) == mandated.end())
            {
                merged.emplace(name, value);
            }
        }
        for (const auto &[name, value] : mandated)
        {
            merged[name] = value;
        }
        return merged;
    }

    ErrorCode classify_status(int status) noexcept
    {
        if (status >= 500 && status <= 599)
        {
            return ErrorCode::ServerError;
        }
        switch (status)
        {
        case kStatusConflict:
            return ErrorCode::OffsetConflict;
        case kStatusLocked:
            return ErrorCode::Locked;
        case kStatusChecksumMismatch:
            return ErrorCode::ChecksumMismatch;
        default:
            break;
        }
        if (status >= 400 && status <= 499)
        {
            return ErrorCode::ClientError;
        }
        return ErrorCode::ProtocolError;
    }

    bool ServerCapabilities::supports(std::string_view extension) const
    {
        return std::any_of(extensions.begin(), extensions.end(), [&](const std::string &item)
                           { return http::iequals(item, extension); });
    }

    ServerCapabilities capabilities_from_headers(const http::HeaderMap &headers)
    {
        ServerCapabilities caps;
        if (const auto it = headers.find(std::string(kTusResumable)); it != headers.end())
        {
            caps.resumable = it->second;
        }
        if (const auto it = headers.find("Tus-Version"); it != headers.end())
        {
            caps.versions = split_list(it->second);
        }
        if (const auto it = headers.find("Tus-Extension"); it != headers.end())
        {
            caps.extensions = split_list(it->second);
        }
        if (const auto it = headers.find("Tus-Checksum-Algorithm"); it != headers.end())
        {
            caps.checksum_algorithms = split_list(it->second);
        }
        if (const auto it = headers.find("Tus-Max-Size"); it != headers.end())
        {
            caps.max_size = http::parse_unsigned(it->second);
        }
        return caps;
    }

    std::vector<std::string> split_list(std::string_view value)
    {
        std::vector<std::string> items;
        while (!value.empty())
        {
            const auto comma = value.find(',');
            const auto item = trim(value.substr(0, comma));
            if (!item.empty())
            {
                items.emplace_back(item);
            }
            if (comma == std::string_view::npos)
            {
                break;
            }
            value.remove_prefix(comma + 1);
        }
        return items;
    }

} // namespace tusc::protocol
