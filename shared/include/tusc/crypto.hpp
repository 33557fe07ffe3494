/**
 * tusc - Hashing helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tusc::crypto
{

    void ensure_sodium_init();

    // BLAKE2b (crypto_generichash) digests, hex encoded.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_text(std::string_view text);

    // Hashes at most `limit` bytes of the stream when a limit is given.
    std::string hash_stream(std::istream &input, std::optional<std::uint64_t> limit = std::nullopt);

    std::string hash_file(const std::filesystem::path &path);

    std::string hash_file_prefix(const std::filesystem::path &path, std::uint64_t prefix_bytes);

    // SipHash (crypto_shorthash) under a fixed key. Not collision resistant,
    // only used to fold already-hashed material into a short tag.
    std::string short_hash(std::string_view text);

} // namespace tusc::crypto
