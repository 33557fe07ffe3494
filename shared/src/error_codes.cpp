#include "tusc/error_codes.hpp"

#include <array>

namespace tusc
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            bool retryable;
        };

        constexpr std::array<ErrorCodeDescription, 17> kDescriptions{{
            {ErrorCode::Ok, "ok", false},
            {ErrorCode::InvalidConfig, "invalid_config", false},
            {ErrorCode::FileNotFound, "file_not_found", false},
            {ErrorCode::FileIo, "file_io", false},
            {ErrorCode::CreateFailed, "create_failed", false},
            {ErrorCode::StateInvalid, "state_invalid", false},
            {ErrorCode::Timeout, "timeout", true},
            {ErrorCode::ConnectionReset, "connection_reset", true},
            {ErrorCode::ServerError, "server_error", true},
            {ErrorCode::Locked, "locked", true},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch", true},
            {ErrorCode::ClientError, "client_error", false},
            {ErrorCode::OffsetConflict, "offset_conflict", false},
            {ErrorCode::ProtocolError, "protocol_error", false},
            {ErrorCode::RetriesExhausted, "retries_exhausted", false},
            {ErrorCode::Cancelled, "cancelled", false},
            {ErrorCode::InternalError, "internal_error", false},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    bool is_retryable(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.retryable;
            }
        }
        return false;
    }

    TransferError::TransferError(ErrorCode code, const std::string &message, int status)
        : std::runtime_error(message),
          code_(code),
          status_(status) {}

} // namespace tusc
