/**
 * tusc - Error taxonomy shared by the transport, protocol and engine layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tusc
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidConfig = 1,
        FileNotFound = 2,
        FileIo = 3,
        CreateFailed = 4,
        StateInvalid = 5,
        Timeout = 6,
        ConnectionReset = 7,
        ServerError = 8,
        Locked = 9,
        ChecksumMismatch = 10,
        ClientError = 11,
        OffsetConflict = 12,
        ProtocolError = 13,
        RetriesExhausted = 14,
        Cancelled = 15,
        InternalError = 16
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // Transient failures worth another attempt at the same offset.
    bool is_retryable(ErrorCode code) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, const std::string &message, int status = 0);

        ErrorCode code() const noexcept { return code_; }
        int status() const noexcept { return status_; }

    private:
        ErrorCode code_;
        int status_;
    };

} // namespace tusc
