#include "tusc/client/protocol_client.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace tusc::client
{

    namespace
    {

        struct PhaseMapping
        {
            UploadPhase phase;
            std::string_view label;
        };

        constexpr std::array<PhaseMapping, 5> kPhaseMappings{{
            {UploadPhase::Unstarted, "unstarted"},
            {UploadPhase::Created, "created"},
            {UploadPhase::InProgress, "in-progress"},
            {UploadPhase::Completed, "completed"},
            {UploadPhase::Failed, "failed"},
        }};

        http::Url require_url(const std::string &text)
        {
            auto url = http::parse_url(text);
            if (!url)
            {
                throw TransferError(ErrorCode::InvalidConfig, "Invalid upload URL: " + text);
            }
            return *url;
        }

        http::HeaderMap tus_headers()
        {
            http::HeaderMap headers;
            headers[std::string(protocol::kTusResumable)] = std::string(protocol::kTusVersion);
            return headers;
        }

        std::string describe(const http::HttpResponse &response)
        {
            auto text = std::to_string(response.status);
            if (!response.reason.empty())
            {
                text += " " + response.reason;
            }
            return text;
        }

    } // namespace

    std::string_view to_string(UploadPhase phase) noexcept
    {
        for (const auto &mapping : kPhaseMappings)
        {
            if (mapping.phase == phase)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    ProtocolClient::ProtocolClient(http::HttpTransport &transport, Logger logger)
        : transport_(transport),
          logger_(std::move(logger)) {}

    std::string ProtocolClient::create_upload(const std::string &endpoint, std::uint64_t size,
                                              const std::string &name, const http::HeaderMap &headers)
    {
        auto mandated = tus_headers();
        mandated[std::string(protocol::kUploadLength)] = std::to_string(size);
        mandated[std::string(protocol::kUploadMetadata)] = protocol::encode_metadata({{"name", name}});

        http::HttpResponse response;
        try
        {
            response = send("POST", endpoint, headers, std::move(mandated));
        }
        catch (const TransferError &ex)
        {
            // Creation is never retried, whatever the underlying cause.
            fail(ErrorCode::CreateFailed, std::string("Upload creation failed: ") + ex.what(), ex.status());
        }

        if (response.status != protocol::kStatusCreated && response.status != protocol::kStatusOk)
        {
            fail(ErrorCode::CreateFailed, "Upload creation failed: server answered " + describe(response),
                 response.status);
        }
        const auto location = response.header(std::string(protocol::kLocation));
        if (!location || location->empty())
        {
            fail(ErrorCode::CreateFailed, "Upload creation response carries no Location header", response.status);
        }

        auto remote_url = http::resolve_reference(require_url(endpoint), *location);
        phase_ = UploadPhase::Created;
        declared_length_ = size;
        logger_.log("protocol", "created ", remote_url, " length=", size);
        return remote_url;
    }

    std::uint64_t ProtocolClient::query_offset(const std::string &remote_url, const http::HeaderMap &headers)
    {
        const auto response = send("HEAD", remote_url, headers, tus_headers());
        if (response.status != protocol::kStatusOk && response.status != protocol::kStatusNoContent)
        {
            fail(ErrorCode::StateInvalid, "Offset query for " + remote_url + " answered " + describe(response),
                 response.status);
        }
        const auto header = response.header(std::string(protocol::kUploadOffset));
        const auto offset = header ? http::parse_unsigned(*header) : std::nullopt;
        if (!offset)
        {
            fail(ErrorCode::StateInvalid, "Offset query for " + remote_url + " returned no usable Upload-Offset",
                 response.status);
        }

        declared_length_.reset();
        if (const auto length = response.header(std::string(protocol::kUploadLength)))
        {
            declared_length_ = http::parse_unsigned(*length);
        }
        advance(*offset);
        return *offset;
    }

    PatchAck ProtocolClient::patch_chunk(const std::string &remote_url, std::span<const std::byte> data,
                                         std::uint64_t offset, const http::HeaderMap &headers)
    {
        auto mandated = tus_headers();
        mandated[std::string(protocol::kUploadOffset)] = std::to_string(offset);
        mandated[std::string(protocol::kContentType)] = std::string(protocol::kOffsetContentType);

        const auto response = send("PATCH", remote_url, headers, std::move(mandated), data);
        if (response.status != protocol::kStatusNoContent)
        {
            fail(protocol::classify_status(response.status),
                 "Chunk at offset " + std::to_string(offset) + " rejected: " + describe(response), response.status);
        }

        PatchAck ack{offset + data.size()};
        if (const auto header = response.header(std::string(protocol::kUploadOffset)))
        {
            const auto reported = http::parse_unsigned(*header);
            if (!reported)
            {
                fail(ErrorCode::ProtocolError, "Malformed Upload-Offset in chunk response: " + *header,
                     response.status);
            }
            ack.offset = *reported;
        }
        if (ack.offset <= offset || (declared_length_ && ack.offset > *declared_length_))
        {
            fail(ErrorCode::ProtocolError,
                 "Server acknowledged offset " + std::to_string(ack.offset) + " after a chunk sent at " +
                     std::to_string(offset),
                 response.status);
        }
        advance(ack.offset);
        return ack;
    }

    protocol::ServerCapabilities ProtocolClient::query_options(const std::string &endpoint,
                                                               const http::HeaderMap &headers)
    {
        const auto response = send("OPTIONS", endpoint, headers, tus_headers());
        if (response.status != protocol::kStatusOk && response.status != protocol::kStatusNoContent)
        {
            fail(protocol::classify_status(response.status), "Capability query answered " + describe(response),
                 response.status);
        }
        return protocol::capabilities_from_headers(response.headers);
    }

    http::HttpResponse ProtocolClient::send(std::string_view method, const std::string &url,
                                            const http::HeaderMap &caller, http::HeaderMap mandated,
                                            std::span<const std::byte> body)
    {
        http::HttpRequest request;
        request.method = std::string(method);
        request.url = require_url(url);
        request.headers = protocol::merge_headers(caller, mandated);
        request.body = body;

        try
        {
            auto response = transport_.perform(request, timeout_);
            logger_.log("http", method, " ", url, " -> ", response.status);
            return response;
        }
        catch (const TransferError &ex)
        {
            phase_ = UploadPhase::Failed;
            logger_.warn("http", method, " ", url, " failed: ", ex.what());
            throw;
        }
    }

    void ProtocolClient::fail(ErrorCode code, const std::string &message, int status)
    {
        phase_ = UploadPhase::Failed;
        logger_.warn("protocol", message);
        throw TransferError(code, message, status);
    }

    void ProtocolClient::advance(std::uint64_t offset) noexcept
    {
        if (declared_length_ && offset >= *declared_length_)
        {
            phase_ = UploadPhase::Completed;
        }
        else if (offset > 0)
        {
            phase_ = UploadPhase::InProgress;
        }
        else
        {
            phase_ = UploadPhase::Created;
        }
    }

} // namespace tusc::client
