#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

#include "tusc/client/concurrency_guard.hpp"
#include "tusc/client/file_identity.hpp"
#include "tusc/client/logger.hpp"
#include "tusc/client/protocol_client.hpp"
#include "tusc/client/state_store.hpp"
#include "tusc/error_codes.hpp"
#include "tusc/http_message.hpp"

namespace tusc::client
{

    struct TimeoutPolicy
    {
        std::chrono::seconds base{30};
        std::chrono::seconds per_chunk_mib{5};
        std::chrono::seconds per_extra_gib{10};
        std::chrono::seconds minimum{std::chrono::minutes(1)};
        std::chrono::seconds maximum{std::chrono::minutes(30)};
    };

    // Base allowance, plus per MiB of chunk, plus per GiB of file beyond the
    // first, clamped to [minimum, maximum].
    std::chrono::milliseconds compute_request_timeout(std::uint64_t chunk_size, std::uint64_t file_size,
                                                      const TimeoutPolicy &policy = {});

    // Delay before retry number `failure` (0-based): min(base * 2^failure, cap).
    std::chrono::milliseconds backoff_delay(unsigned failure, std::chrono::milliseconds base,
                                            std::chrono::milliseconds cap);

    std::uint64_t checkpoint_interval(std::uint64_t file_size, std::uint64_t chunk_size, std::uint64_t floor);

    struct TransferOptions
    {
        std::string endpoint;
        std::uint64_t chunk_size{2ULL * 1024 * 1024};
        http::HeaderMap headers;
        // Retries per chunk after the first attempt.
        unsigned max_retries{5};
        bool reset{false};

        FingerprintPolicy fingerprint;
        std::uint64_t checkpoint_floor{10ULL * 1024 * 1024};
        std::chrono::milliseconds backoff_base{std::chrono::seconds(1)};
        std::chrono::milliseconds backoff_cap{std::chrono::seconds(30)};
        // Minimum gap between progress samples. The completion sample is sent
        // regardless, unless the previous sample already reported the full size.
        std::chrono::milliseconds progress_interval{std::chrono::seconds(1)};
        std::chrono::seconds retention{std::chrono::hours(1)};
        TimeoutPolicy timeout;
    };

    struct ProgressSample
    {
        std::uint64_t bytes_transferred{};
        std::uint64_t total_bytes{};
        double bytes_per_second{};
    };

    struct UploadOutcome
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message;
        std::string remote_url;
        // Last offset confirmed by the server.
        std::uint64_t offset{};
        // A rerun continues from the preserved checkpoint.
        bool resumable{};

        bool ok() const noexcept { return code == ErrorCode::Ok; }
    };

    class TransferEngine
    {
    public:
        using ProgressCallback = std::function<void(const ProgressSample &)>;
        using NoticeCallback = std::function<void(const std::string &)>;
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        TransferEngine(ProtocolClient &client, StateStore &store, ConcurrencyGuard &guard, Logger logger = {});

        void on_progress(ProgressCallback callback) { progress_ = std::move(callback); }
        void on_notice(NoticeCallback callback) { notice_ = std::move(callback); }
        void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

        // Runs one upload to completion, failure or cancellation. Never throws;
        // every failure is reported through the outcome. Cancellation is
        // observed between chunks only.
        UploadOutcome upload(const std::filesystem::path &file, const TransferOptions &options,
                             std::stop_token stop = {});

    private:
        struct Session;

        UploadOutcome run(Session &session, std::stop_token stop);
        void start(Session &session);
        std::optional<std::uint64_t> try_resume(Session &session, const UploadState &stored);
        void discard(Session &session, const std::string &remote_url);
        void checkpoint(Session &session);
        void report_progress(Session &session, bool final);
        UploadOutcome finish(Session &session, ErrorCode code, const std::string &message);
        void notify(const std::string &message);

        ProtocolClient &client_;
        StateStore &store_;
        ConcurrencyGuard &guard_;
        Logger logger_;
        ProgressCallback progress_;
        NoticeCallback notice_;
        Sleeper sleeper_;
    };

} // namespace tusc::client
