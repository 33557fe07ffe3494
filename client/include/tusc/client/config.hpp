#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "tusc/client/transfer_engine.hpp"
#include "tusc/http_message.hpp"

namespace tusc::client
{

    inline constexpr std::uint64_t kMinChunkSize = 64ULL * 1024;
    inline constexpr std::uint64_t kMaxChunkSize = 32ULL * 1024 * 1024;
    inline constexpr std::uint64_t kDefaultChunkSize = 2ULL * 1024 * 1024;
    inline constexpr unsigned kMaxRetries = 10;
    inline constexpr unsigned kDefaultRetries = 5;

    struct ClientConfig
    {
        std::optional<std::filesystem::path> file;
        std::string endpoint;
        std::uint64_t chunk_size{kDefaultChunkSize};
        http::HeaderMap headers;
        unsigned max_retries{kDefaultRetries};
        bool reset{false};
        bool query_options{false};
        std::optional<std::filesystem::path> state_dir;
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        bool show_help{false};
        bool show_version{false};
        // Adjustments made while clamping values into range.
        std::vector<std::string> warnings;
    };

    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    std::optional<std::string> process_environment(const std::string &name);

    // Environment first (TUSC_*), then flags. Throws tusc::TransferError with
    // ErrorCode::InvalidConfig on malformed input.
    ClientConfig parse_arguments(int argc, char *argv[], const EnvLookup &env = process_environment);

    std::string usage();

    TransferOptions to_transfer_options(const ClientConfig &config);

} // namespace tusc::client
