#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "tusc/client/concurrency_guard.hpp"
#include "tusc/client/config.hpp"
#include "tusc/client/logger.hpp"
#include "tusc/client/process_probe.hpp"
#include "tusc/client/protocol_client.hpp"
#include "tusc/client/state_store.hpp"
#include "tusc/client/transfer_engine.hpp"
#include "tusc/crypto.hpp"
#include "tusc/error_codes.hpp"
#include "tusc/http_transport.hpp"
#include "tusc/version.hpp"

namespace
{

    constexpr int kExitSuccess = 0;
    constexpr int kExitFatal = 1;
    constexpr int kExitResumable = 2;

    volatile std::sig_atomic_t interrupted = 0;

    extern "C" void handle_interrupt(int)
    {
        interrupted = 1;
    }

    std::string join(const std::vector<std::string> &values)
    {
        std::string result;
        for (const auto &value : values)
        {
            if (!result.empty())
            {
                result += ", ";
            }
            result += value;
        }
        return result.empty() ? "-" : result;
    }

    void print_options(tusc::client::ProtocolClient &client, const tusc::client::ClientConfig &config)
    {
        const auto caps = client.query_options(config.endpoint, config.headers);
        std::cout << "Tus-Resumable:          " << caps.resumable.value_or("-") << std::endl;
        std::cout << "Tus-Version:            " << join(caps.versions) << std::endl;
        std::cout << "Tus-Extension:          " << join(caps.extensions) << std::endl;
        std::cout << "Tus-Checksum-Algorithm: " << join(caps.checksum_algorithms) << std::endl;
        std::cout << "Tus-Max-Size:           "
                  << (caps.max_size ? std::to_string(*caps.max_size) : std::string("-")) << std::endl;
        if (!caps.supports("creation"))
        {
            std::cerr << "WARNING: server does not advertise the creation extension; uploads will fail" << std::endl;
        }
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace tusc::client;
    try
    {
        const auto config = parse_arguments(argc, argv);
        if (config.show_help)
        {
            std::cout << usage();
            return kExitSuccess;
        }
        if (config.show_version)
        {
            std::cout << "tusc " << tusc::version() << std::endl;
            return kExitSuccess;
        }

        tusc::crypto::ensure_sodium_init();
        Logger logger(config.log_path, config.verbose);
        for (const auto &warning : config.warnings)
        {
            std::cerr << "[warning] " << warning << std::endl;
            logger.warn("config", warning);
        }

        tusc::http::AsioHttpTransport transport("tusc/" + std::string(tusc::version()));
        ProtocolClient client(transport, logger);
        if (config.query_options)
        {
            print_options(client, config);
            if (!config.file)
            {
                return kExitSuccess;
            }
        }

        DirectoryStateStore store(config.state_dir.value_or(DirectoryStateStore::default_directory()),
                                  current_process_owner(), logger);
        const auto probe = make_default_process_probe();
        ConcurrencyGuard guard(store, *probe, std::chrono::minutes(5), logger);
        TransferEngine engine(client, store, guard, logger);

        engine.on_progress([](const ProgressSample &sample)
                           { std::cout << "\rUploaded " << sample.bytes_transferred << " / " << sample.total_bytes
                                       << " bytes (" << static_cast<std::uint64_t>(sample.bytes_per_second)
                                       << " B/s)" << std::flush; });
        engine.on_notice([](const std::string &message)
                         { std::cerr << "[tusc] " << message << std::endl; });

        // The signal handler only sets a flag; the watcher turns it into a
        // stop request that the engine sees before its next chunk.
        std::signal(SIGINT, handle_interrupt);
        std::signal(SIGTERM, handle_interrupt);
        std::stop_source cancel;
        std::jthread watcher([&cancel](std::stop_token own)
                             {
                                 while (!own.stop_requested())
                                 {
                                     if (interrupted)
                                     {
                                         cancel.request_stop();
                                         return;
                                     }
                                     std::this_thread::sleep_for(std::chrono::milliseconds(100));
                                 } });

        const auto outcome = engine.upload(*config.file, to_transfer_options(config), cancel.get_token());
        watcher.request_stop();
        std::cout << std::endl;
        if (outcome.ok())
        {
            std::cout << "Upload complete: " << outcome.remote_url << std::endl;
            return kExitSuccess;
        }
        std::cerr << "ERROR: " << tusc::to_string(outcome.code) << ": " << outcome.message << std::endl;
        if (outcome.resumable)
        {
            std::cerr << "Run the same command again to resume from byte " << outcome.offset << std::endl;
            return kExitResumable;
        }
        return kExitFatal;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return kExitFatal;
    }
}
