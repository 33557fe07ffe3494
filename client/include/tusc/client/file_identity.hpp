#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace tusc::client
{

    enum class FingerprintStrategy : std::uint8_t
    {
        Full,
        Hybrid,
        Meta,
        Path
    };

    std::string_view to_string(FingerprintStrategy strategy) noexcept;

    struct FileFingerprint
    {
        FingerprintStrategy strategy{FingerprintStrategy::Path};
        std::string digest;

        // "<strategy>_<digest>", the form embedded in state record names.
        std::string to_string() const;

        bool operator==(const FileFingerprint &) const = default;
    };

    struct FingerprintPolicy
    {
        std::uint64_t full_hash_limit{50ULL * 1024 * 1024};
        std::uint64_t hybrid_limit{500ULL * 1024 * 1024};
        std::uint64_t header_bytes{1024 * 1024};
    };

    // Size-tiered: whole-content hash, header hash folded with size and mtime,
    // metadata only, or the path alone when the file cannot be read.
    FileFingerprint compute_fingerprint(const std::filesystem::path &path, const FingerprintPolicy &policy = {});

    // Untagged path digest used by earlier releases for record names. Only
    // consulted when discovering state, never written.
    std::string legacy_fingerprint(const std::filesystem::path &path);

    std::filesystem::path canonical_source_path(const std::filesystem::path &path);

} // namespace tusc::client
