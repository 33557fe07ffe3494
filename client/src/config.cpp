#include "tusc/client/config.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

#include "tusc/error_codes.hpp"

namespace tusc::client
{

    namespace
    {
        constexpr double kMiB = 1024.0 * 1024.0;

        [[noreturn]] void invalid(const std::string &message)
        {
            throw TransferError(ErrorCode::InvalidConfig, message);
        }

        std::string_view trim(std::string_view text)
        {
            const auto begin = text.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = text.find_last_not_of(" \t");
            return text.substr(begin, end - begin + 1);
        }

        std::uint64_t parse_chunk_mib(std::string_view text, std::vector<std::string> &warnings)
        {
            const auto value_text = trim(text);
            double mib = 0.0;
            const auto [ptr, ec] = std::from_chars(value_text.data(), value_text.data() + value_text.size(), mib);
            if (ec != std::errc{} || ptr != value_text.data() + value_text.size() || !std::isfinite(mib) || mib <= 0.0)
            {
                invalid("Chunk size must be a positive number of MiB, got '" + std::string(text) + "'");
            }
            const auto requested = mib * kMiB;
            if (requested < static_cast<double>(kMinChunkSize))
            {
                warnings.push_back("Chunk size raised to the 64 KiB minimum");
                return kMinChunkSize;
            }
            if (requested > static_cast<double>(kMaxChunkSize))
            {
                warnings.push_back("Chunk size lowered to the 32 MiB maximum");
                return kMaxChunkSize;
            }
            return static_cast<std::uint64_t>(requested);
        }

        unsigned parse_retries(std::string_view text, std::vector<std::string> &warnings)
        {
            const auto value = http::parse_unsigned(text);
            if (!value)
            {
                invalid("Retry count must be a non-negative integer, got '" + std::string(text) + "'");
            }
            if (*value > kMaxRetries)
            {
                warnings.push_back("Retry count lowered to the maximum of " + std::to_string(kMaxRetries));
                return kMaxRetries;
            }
            return static_cast<unsigned>(*value);
        }

        void add_header(http::HeaderMap &headers, std::string_view entry)
        {
            const auto colon = entry.find(':');
            const auto name = trim(entry.substr(0, colon));
            if (colon == std::string_view::npos || name.empty())
            {
                invalid("Header must look like 'Name: Value', got '" + std::string(entry) + "'");
            }
            headers[std::string(name)] = std::string(trim(entry.substr(colon + 1)));
        }

        void add_header_list(http::HeaderMap &headers, std::string_view list)
        {
            while (!list.empty())
            {
                const auto comma = list.find(',');
                const auto entry = trim(list.substr(0, comma));
                if (!entry.empty())
                {
                    add_header(headers, entry);
                }
                if (comma == std::string_view::npos)
                {
                    break;
                }
                list.remove_prefix(comma + 1);
            }
        }

        void apply_environment(ClientConfig &config, const EnvLookup &env)
        {
            if (auto value = env("TUSC_ENDPOINT"))
            {
                config.endpoint = *value;
            }
            if (auto value = env("TUSC_CHUNK_SIZE"))
            {
                config.chunk_size = parse_chunk_mib(*value, config.warnings);
            }
            if (auto value = env("TUSC_HEADERS"))
            {
                add_header_list(config.headers, *value);
            }
            if (auto value = env("TUSC_RETRIES"))
            {
                config.max_retries = parse_retries(*value, config.warnings);
            }
            if (auto value = env("TUSC_STATE_DIR"); value && !value->empty())
            {
                config.state_dir = std::filesystem::path(*value);
            }
        }

    } // namespace

    std::optional<std::string> process_environment(const std::string &name)
    {
        if (const char *value = std::getenv(name.c_str()))
        {
            return std::string(value);
        }
        return std::nullopt;
    }

    ClientConfig parse_arguments(int argc, char *argv[], const EnvLookup &env)
    {
        ClientConfig config;
        apply_environment(config, env);

        int index = 1;
        const auto next_value = [&](const std::string &flag) -> std::string
        {
            if (index >= argc)
            {
                invalid(flag + " requires a value");
            }
            return argv[index++];
        };

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "-t" || arg == "--endpoint")
            {
                config.endpoint = next_value(arg);
            }
            else if (arg == "-c" || arg == "--chunk-size")
            {
                config.chunk_size = parse_chunk_mib(next_value(arg), config.warnings);
            }
            else if (arg == "-H" || arg == "--header")
            {
                add_header(config.headers, next_value(arg));
            }
            else if (arg == "-r" || arg == "--reset")
            {
                config.reset = true;
            }
            else if (arg == "-o" || arg == "--options")
            {
                config.query_options = true;
            }
            else if (arg == "--retries")
            {
                config.max_retries = parse_retries(next_value(arg), config.warnings);
            }
            else if (arg == "--state-dir")
            {
                config.state_dir = std::filesystem::path(next_value(arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(next_value(arg));
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "-h" || arg == "--help")
            {
                config.show_help = true;
            }
            else if (arg == "--version")
            {
                config.show_version = true;
            }
            else if (arg.starts_with("-") && arg.size() > 1)
            {
                invalid("Unknown argument: " + arg);
            }
            else if (config.file)
            {
                invalid("Only one file can be uploaded per invocation");
            }
            else
            {
                config.file = std::filesystem::path(arg);
            }
        }

        if (config.show_help || config.show_version)
        {
            return config;
        }
        if (config.endpoint.empty())
        {
            invalid("An endpoint is required (--endpoint or TUSC_ENDPOINT)");
        }
        if (!http::parse_url(config.endpoint))
        {
            invalid("Endpoint must be an http:// or https:// URL, got '" + config.endpoint + "'");
        }
        if (!config.file && !config.query_options)
        {
            invalid("No file given\n" + usage());
        }
        return config;
    }

    std::string usage()
    {
        return "Usage: tusc [options] <file>\n"
               "  -t, --endpoint URL     Upload endpoint (TUSC_ENDPOINT)\n"
               "  -c, --chunk-size MiB   Chunk size, 0.0625 to 32 (TUSC_CHUNK_SIZE, default 2)\n"
               "  -H, --header 'K: V'    Extra request header, repeatable (TUSC_HEADERS=k:v,k:v)\n"
               "  -r, --reset            Discard saved state and start a new upload\n"
               "  -o, --options          Query server capabilities\n"
               "      --retries N        Retries per chunk, 0 to 10 (TUSC_RETRIES, default 5)\n"
               "      --state-dir DIR    State directory (TUSC_STATE_DIR)\n"
               "      --log FILE         Append diagnostics to FILE\n"
               "  -v, --verbose          Diagnostics on stderr\n"
               "  -h, --help             Show this help\n"
               "      --version          Show the version\n";
    }

    TransferOptions to_transfer_options(const ClientConfig &config)
    {
        TransferOptions options;
        options.endpoint = config.endpoint;
        options.chunk_size = config.chunk_size;
        options.headers = config.headers;
        options.max_retries = config.max_retries;
        options.reset = config.reset;
        return options;
    }

} // namespace tusc::client
