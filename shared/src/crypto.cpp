#include "tusc/crypto.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace tusc::crypto
{

    namespace
    {

        // Fixed so that short hashes are stable across runs and machines.
        constexpr std::array<unsigned char, crypto_shorthash_KEYBYTES> kShortHashKey{
            't', 'u', 's', 'c', '-', 'f', 'i', 'n', 'g', 'e', 'r', 'p', 'r', 'i', 'n', 't'};

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        std::ifstream open_for_hashing(const std::filesystem::path &path)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                throw std::runtime_error("Failed to open file for hashing: " + path.string());
            }
            return file;
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_text(std::string_view text)
    {
        return hash_bytes(std::as_bytes(std::span(text.data(), text.size())));
    }

    std::string hash_stream(std::istream &input, std::optional<std::uint64_t> limit)
    {
        ensure_initialized_once();
        crypto_generichash_state state;
        if (crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }

        std::vector<unsigned char> buffer(64 * 1024);
        std::uint64_t remaining = limit.value_or(std::numeric_limits<std::uint64_t>::max());
        while (input && remaining > 0)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(want));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count == 0)
            {
                break;
            }
            if (crypto_generichash_update(&state, buffer.data(), read_count) != 0)
            {
                throw std::runtime_error("crypto_generichash_update failed");
            }
            remaining -= read_count;
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing stream");
        }

        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash_final(&state, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        auto file = open_for_hashing(path);
        return hash_stream(file);
    }

    std::string hash_file_prefix(const std::filesystem::path &path, std::uint64_t prefix_bytes)
    {
        auto file = open_for_hashing(path);
        return hash_stream(file, prefix_bytes);
    }

    std::string short_hash(std::string_view text)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_shorthash_BYTES> digest{};
        crypto_shorthash(digest.data(), reinterpret_cast<const unsigned char *>(text.data()), text.size(),
                         kShortHashKey.data());
        return to_hex(digest);
    }

} // namespace tusc::crypto
