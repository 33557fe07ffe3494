#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "tusc/client/logger.hpp"
#include "tusc/error_codes.hpp"
#include "tusc/http_transport.hpp"
#include "tusc/protocol.hpp"

namespace tusc::client
{

    enum class UploadPhase : std::uint8_t
    {
        Unstarted,
        Created,
        InProgress,
        Completed,
        Failed
    };

    std::string_view to_string(UploadPhase phase) noexcept;

    struct PatchAck
    {
        // Offset the server reports after appending the chunk.
        std::uint64_t offset{};
    };

    // Client side of the tus core protocol (plus the OPTIONS discovery
    // request). Every failure is thrown as tusc::TransferError:
    //   create_upload  -> ErrorCode::CreateFailed for any failure (never retried)
    //   query_offset   -> ErrorCode::StateInvalid, or the transport's code
    //   patch_chunk    -> classify_status() of the response, or the transport's code
    class ProtocolClient
    {
    public:
        explicit ProtocolClient(http::HttpTransport &transport, Logger logger = {});

        void set_timeout(std::chrono::milliseconds timeout) noexcept { timeout_ = timeout; }
        std::chrono::milliseconds timeout() const noexcept { return timeout_; }

        std::string create_upload(const std::string &endpoint, std::uint64_t size, const std::string &name,
                                  const http::HeaderMap &headers);

        std::uint64_t query_offset(const std::string &remote_url, const http::HeaderMap &headers);

        PatchAck patch_chunk(const std::string &remote_url, std::span<const std::byte> data, std::uint64_t offset,
                             const http::HeaderMap &headers);

        protocol::ServerCapabilities query_options(const std::string &endpoint, const http::HeaderMap &headers);

        UploadPhase phase() const noexcept { return phase_; }
        std::optional<std::uint64_t> declared_length() const noexcept { return declared_length_; }

    private:
        http::HttpResponse send(std::string_view method, const std::string &url, const http::HeaderMap &caller,
                                http::HeaderMap mandated, std::span<const std::byte> body = {});

        [[noreturn]] void fail(ErrorCode code, const std::string &message, int status = 0);

        void advance(std::uint64_t offset) noexcept;

        http::HttpTransport &transport_;
        Logger logger_;
        std::chrono::milliseconds timeout_{std::chrono::minutes(1)};
        UploadPhase phase_{UploadPhase::Unstarted};
        std::optional<std::uint64_t> declared_length_;
    };

} // namespace tusc::client
