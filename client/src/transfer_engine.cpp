#include "tusc/client/transfer_engine.hpp"

#include <algorithm>
#include <fstream>
#include <span>
#include <system_error>
#include <thread>
#include <vector>

namespace tusc::client
{

    namespace
    {
        constexpr std::uint64_t kMiB = 1024ULL * 1024;
        constexpr std::uint64_t kGiB = 1024ULL * kMiB;

        std::span<const std::byte> read_chunk(std::ifstream &in, std::vector<std::byte> &buffer, std::uint64_t offset,
                                              std::uint64_t length)
        {
            buffer.resize(length);
            in.clear();
            in.seekg(static_cast<std::streamoff>(offset));
            in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(length));
            if (static_cast<std::uint64_t>(in.gcount()) != length)
            {
                throw TransferError(ErrorCode::FileIo, "Short read of " + std::to_string(length) +
                                                           " bytes at offset " + std::to_string(offset));
            }
            return {buffer.data(), buffer.size()};
        }

    } // namespace

    std::chrono::milliseconds compute_request_timeout(std::uint64_t chunk_size, std::uint64_t file_size,
                                                      const TimeoutPolicy &policy)
    {
        const auto chunk_mib = static_cast<std::int64_t>((chunk_size + kMiB - 1) / kMiB);
        const auto extra_gib = static_cast<std::int64_t>(file_size > kGiB ? (file_size - kGiB + kGiB - 1) / kGiB : 0);
        const std::chrono::seconds total = policy.base + policy.per_chunk_mib * chunk_mib +
                                           policy.per_extra_gib * extra_gib;
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::clamp(total, policy.minimum, policy.maximum));
    }

    std::chrono::milliseconds backoff_delay(unsigned failure, std::chrono::milliseconds base,
                                            std::chrono::milliseconds cap)
    {
        auto delay = base;
        for (unsigned i = 0; i < failure && delay < cap; ++i)
        {
            delay *= 2;
        }
        return std::min(delay, cap);
    }

    std::uint64_t checkpoint_interval(std::uint64_t file_size, std::uint64_t chunk_size, std::uint64_t floor)
    {
        return std::max({floor, file_size / 20, chunk_size * 2});
    }

    struct TransferEngine::Session
    {
        std::filesystem::path file;
        const TransferOptions &options;
        StateKey key;
        std::uint64_t size{};
        std::ifstream in;
        UploadState state;
        std::uint64_t last_checkpoint{};
        std::uint64_t interval{};

        std::chrono::steady_clock::time_point progress_time{};
        std::uint64_t progress_offset{};
        bool progress_emitted{};
    };

    TransferEngine::TransferEngine(ProtocolClient &client, StateStore &store, ConcurrencyGuard &guard, Logger logger)
        : client_(client),
          store_(store),
          guard_(guard),
          logger_(std::move(logger)),
          sleeper_([](std::chrono::milliseconds delay)
                   { std::this_thread::sleep_for(delay); }) {}

    UploadOutcome TransferEngine::upload(const std::filesystem::path &file, const TransferOptions &options,
                                         std::stop_token stop)
    {
        Session session{file, options};
        try
        {
            return run(session, stop);
        }
        catch (const TransferError &ex)
        {
            return finish(session, ex.code(), ex.what());
        }
        catch (const std::exception &ex)
        {
            return finish(session, ErrorCode::InternalError, ex.what());
        }
    }

    UploadOutcome TransferEngine::run(Session &session, std::stop_token stop)
    {
        const auto &options = session.options;
        if (!http::parse_url(options.endpoint))
        {
            throw TransferError(ErrorCode::InvalidConfig, "Endpoint is not an http(s) URL: '" + options.endpoint + "'");
        }
        if (options.chunk_size == 0)
        {
            throw TransferError(ErrorCode::InvalidConfig, "Chunk size must be positive");
        }

        std::error_code ec;
        if (!std::filesystem::is_regular_file(session.file, ec))
        {
            throw TransferError(ErrorCode::FileNotFound, "File not found: " + session.file.string());
        }
        session.size = std::filesystem::file_size(session.file, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::FileIo, "Cannot stat " + session.file.string() + ": " + ec.message());
        }
        session.in.open(session.file, std::ios::binary);
        if (!session.in.is_open())
        {
            throw TransferError(ErrorCode::FileIo, "Cannot open " + session.file.string() + " for reading");
        }

        session.key = make_state_key(session.file, options.fingerprint);
        session.interval = checkpoint_interval(session.size, options.chunk_size, options.checkpoint_floor);
        client_.set_timeout(compute_request_timeout(options.chunk_size, session.size, options.timeout));
        logger_.log("engine", "file=", session.file.string(), " size=", session.size,
                    " fingerprint=", session.key.fingerprint.to_string(), " timeout=", client_.timeout().count(), "ms");

        start(session);

        auto &state = session.state;
        std::vector<std::byte> buffer;
        unsigned failures = 0;
        bool resync = false;
        session.progress_time = std::chrono::steady_clock::now();
        session.progress_offset = state.offset;

        while (state.offset < session.size)
        {
            if (stop.stop_requested())
            {
                checkpoint(session);
                return finish(session, ErrorCode::Cancelled,
                              "Upload cancelled at offset " + std::to_string(state.offset));
            }

            try
            {
                if (resync)
                {
                    const auto server = client_.query_offset(state.remote_url, options.headers);
                    if (server > session.size)
                    {
                        throw TransferError(ErrorCode::ProtocolError,
                                            "Server offset " + std::to_string(server) + " exceeds the file size");
                    }
                    logger_.log("engine", "resynchronised offset ", state.offset, " -> ", server);
                    state.offset = server;
                    resync = false;
                    continue;
                }

                const auto length = std::min(options.chunk_size, session.size - state.offset);
                const auto data = read_chunk(session.in, buffer, state.offset, length);
                const auto ack = client_.patch_chunk(state.remote_url, data, state.offset, options.headers);
                if (ack.offset > session.size)
                {
                    throw TransferError(ErrorCode::ProtocolError,
                                        "Server acknowledged offset " + std::to_string(ack.offset) +
                                            " beyond the file size");
                }
                state.offset = ack.offset;
                failures = 0;
            }
            catch (const TransferError &ex)
            {
                const bool conflict = ex.code() == ErrorCode::OffsetConflict;
                if (!conflict && !is_retryable(ex.code()))
                {
                    checkpoint(session);
                    return finish(session, ex.code(), ex.what());
                }
                if (failures >= options.max_retries)
                {
                    checkpoint(session);
                    return finish(session, ErrorCode::RetriesExhausted,
                                  "Giving up at offset " + std::to_string(state.offset) + " after " +
                                      std::to_string(failures) + " retries: " + ex.what());
                }
                if (conflict)
                {
                    notify("Server offset disagrees with " + std::to_string(state.offset) + "; resynchronising");
                    resync = true;
                }
                else
                {
                    const auto delay = backoff_delay(failures, options.backoff_base, options.backoff_cap);
                    notify(std::string(ex.what()) + "; retry " + std::to_string(failures + 1) + " of " +
                           std::to_string(options.max_retries) + " in " + std::to_string(delay.count()) + " ms");
                    logger_.warn("engine", "offset=", state.offset, " code=", to_string(ex.code()),
                                 " backoff=", delay.count(), "ms");
                    sleeper_(delay);
                }
                ++failures;
                continue;
            }

            report_progress(session, false);
            if (state.offset >= session.last_checkpoint + session.interval)
            {
                checkpoint(session);
            }
        }

        report_progress(session, true);
        try
        {
            store_.clear(session.key, options.retention, state.remote_url);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("state", "cleanup after completion failed: ", ex.what());
        }
        return finish(session, ErrorCode::Ok, "Upload complete");
    }

    void TransferEngine::start(Session &session)
    {
        const auto &options = session.options;
        std::optional<UploadState> stored;
        if (options.reset)
        {
            store_.clear(session.key, std::chrono::seconds::zero());
            notify("Saved state for " + session.file.filename().string() + " cleared");
        }
        else
        {
            stored = store_.load(session.key, session.size);
        }

        if (const auto report = guard_.check_active(session.key); report.warning)
        {
            notify(*report.warning);
        }

        if (stored)
        {
            if (const auto offset = try_resume(session, *stored))
            {
                session.state = *stored;
                session.state.offset = *offset;
                session.state.chunk_size = options.chunk_size;
                session.state.headers = options.headers;
                notify("Resuming " + session.state.remote_url + " at offset " + std::to_string(*offset));
            }
        }

        if (session.state.remote_url.empty())
        {
            const auto url = client_.create_upload(options.endpoint, session.size,
                                                   session.file.filename().string(), options.headers);
            session.state = UploadState{url, 0, session.size, options.endpoint, options.chunk_size, options.headers, {}};
            notify("Created upload " + url);
        }

        // Saved right away so that other processes see this owner as active.
        checkpoint(session);
    }

    std::optional<std::uint64_t> TransferEngine::try_resume(Session &session, const UploadState &stored)
    {
        if (stored.file_size != session.size || stored.endpoint != session.options.endpoint)
        {
            notify("Saved state belongs to a different upload; starting fresh");
            return std::nullopt;
        }
        try
        {
            const auto offset = client_.query_offset(stored.remote_url, session.options.headers);
            if (offset > session.size)
            {
                notify("Server offset for " + stored.remote_url + " exceeds the file size; starting fresh");
                discard(session, stored.remote_url);
                return std::nullopt;
            }
            logger_.log("engine", "local offset ", stored.offset, ", server offset ", offset);
            return offset;
        }
        catch (const TransferError &ex)
        {
            logger_.warn("engine", "saved upload unusable: ", ex.what());
            notify("Saved upload " + stored.remote_url + " is no longer usable; starting fresh");
            discard(session, stored.remote_url);
            return std::nullopt;
        }
    }

    void TransferEngine::discard(Session &session, const std::string &remote_url)
    {
        try
        {
            store_.discard(session.key, remote_url);
        }
        catch (const std::exception &ex)
        {
            logger_.warn("state", "could not discard records for ", remote_url, ": ", ex.what());
        }
    }

    void TransferEngine::checkpoint(Session &session)
    {
        if (session.state.remote_url.empty())
        {
            return;
        }
        try
        {
            store_.save(session.key, session.state);
            session.last_checkpoint = session.state.offset;
        }
        catch (const std::exception &ex)
        {
            logger_.warn("state", "checkpoint at offset ", session.state.offset, " failed: ", ex.what());
            notify(std::string("Could not save upload state: ") + ex.what());
        }
    }

    void TransferEngine::report_progress(Session &session, bool final)
    {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = now - session.progress_time;
        if (final ? (session.progress_emitted && session.progress_offset == session.state.offset)
                  : elapsed < session.options.progress_interval)
        {
            return;
        }

        ProgressSample sample{session.state.offset, session.size, 0.0};
        const auto seconds = std::chrono::duration<double>(elapsed).count();
        if (seconds > 0.0 && session.state.offset >= session.progress_offset)
        {
            sample.bytes_per_second = static_cast<double>(session.state.offset - session.progress_offset) / seconds;
        }
        session.progress_time = now;
        session.progress_offset = session.state.offset;
        session.progress_emitted = true;
        if (progress_)
        {
            progress_(sample);
        }
    }

    UploadOutcome TransferEngine::finish(Session &session, ErrorCode code, const std::string &message)
    {
        UploadOutcome outcome{code, message, session.state.remote_url, session.state.offset,
                              code == ErrorCode::RetriesExhausted || code == ErrorCode::Cancelled};
        if (outcome.ok())
        {
            logger_.log("engine", "completed ", outcome.remote_url, " bytes=", outcome.offset);
        }
        else
        {
            logger_.error("engine", to_string(code), ": ", message, " (offset ", outcome.offset,
                          ", phase ", to_string(client_.phase()), ")");
        }
        return outcome;
    }

    void TransferEngine::notify(const std::string &message)
    {
        logger_.log("engine", message);
        if (notice_)
        {
            notice_(message);
        }
    }

} // namespace tusc::client
