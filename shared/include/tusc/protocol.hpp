/**
 * tusc - tus 1.0.0 wire constants and header helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tusc/error_codes.hpp"
#include "tusc/http_message.hpp"

namespace tusc::protocol
{

    inline constexpr std::string_view kTusVersion = "1.0.0";

    inline constexpr std::string_view kTusResumable = "Tus-Resumable";
    inline constexpr std::string_view kUploadLength = "Upload-Length";
    inline constexpr std::string_view kUploadOffset = "Upload-Offset";
    inline constexpr std::string_view kUploadMetadata = "Upload-Metadata";
    inline constexpr std::string_view kContentType = "Content-Type";
    inline constexpr std::string_view kLocation = "Location";
    inline constexpr std::string_view kOffsetContentType = "application/offset+octet-stream";

    inline constexpr int kStatusOk = 200;
    inline constexpr int kStatusCreated = 201;
    inline constexpr int kStatusNoContent = 204;
    inline constexpr int kStatusConflict = 409;
    inline constexpr int kStatusLocked = 423;
    inline constexpr int kStatusChecksumMismatch = 460;

    // "key base64(value)" pairs joined by commas, in the given order.
    std::string encode_metadata(const std::vector<std::pair<std::string, std::string>> &metadata);

    // Caller headers first, protocol headers last: a caller header whose name
    // matches a protocol header (case-insensitively) is dropped.
    http::HeaderMap merge_headers(const http::HeaderMap &caller, const http::HeaderMap &mandated);

    // Maps an unexpected HTTP status onto the error taxonomy.
    ErrorCode classify_status(int status) noexcept;

    struct ServerCapabilities
    {
        std::optional<std::string> resumable;
        std::vector<std::string> versions;
        std::vector<std::string> extensions;
        std::vector<std::string> checksum_algorithms;
        std::optional<std::uint64_t> max_size;

        bool supports(std::string_view extension) const;
    };

    ServerCapabilities capabilities_from_headers(const http::HeaderMap &headers);

    std::vector<std::string> split_list(std::string_view value);

} // namespace tusc::protocol
