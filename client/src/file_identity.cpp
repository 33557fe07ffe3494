#include "tusc/client/file_identity.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "tusc/crypto.hpp"

namespace tusc::client
{

    namespace
    {

        struct StrategyMapping
        {
            FingerprintStrategy strategy;
            std::string_view label;
        };

        constexpr std::array<StrategyMapping, 4> kStrategyMappings{{
            {FingerprintStrategy::Full, "full"},
            {FingerprintStrategy::Hybrid, "hybrid"},
            {FingerprintStrategy::Meta, "meta"},
            {FingerprintStrategy::Path, "path"},
        }};

        std::int64_t modification_seconds(const std::filesystem::file_time_type &time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        FileFingerprint path_only(const std::string &source)
        {
            return {FingerprintStrategy::Path, crypto::hash_text(source)};
        }

        std::optional<std::string> content_digest(const std::filesystem::path &path)
        {
            try
            {
                return crypto::hash_file(path);
            }
            catch (const std::runtime_error &)
            {
                return std::nullopt;
            }
        }

        std::optional<std::string> header_digest(const std::filesystem::path &path, std::uint64_t bytes)
        {
            try
            {
                return crypto::hash_file_prefix(path, bytes);
            }
            catch (const std::runtime_error &)
            {
                return std::nullopt;
            }
        }

    } // namespace

    std::string_view to_string(FingerprintStrategy strategy) noexcept
    {
        for (const auto &mapping : kStrategyMappings)
        {
            if (mapping.strategy == strategy)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::string FileFingerprint::to_string() const
    {
        return std::string(client::to_string(strategy)) + "_" + digest;
    }

    FileFingerprint compute_fingerprint(const std::filesystem::path &path, const FingerprintPolicy &policy)
    {
        const auto source = canonical_source_path(path).generic_string();

        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            return path_only(source);
        }
        const auto modified = std::filesystem::last_write_time(path, ec);
        if (ec)
        {
            return path_only(source);
        }
        const auto mtime = modification_seconds(modified);

        // Each content tier falls through to the cheaper one when the file
        // cannot be read.
        if (size <= policy.full_hash_limit)
        {
            if (auto digest = content_digest(path))
            {
                return {FingerprintStrategy::Full, std::move(*digest)};
            }
        }
        if (size <= policy.hybrid_limit)
        {
            if (const auto header = header_digest(path, policy.header_bytes))
            {
                const auto combined = *header + "_" + std::to_string(size) + "_" + std::to_string(mtime);
                return {FingerprintStrategy::Hybrid, crypto::short_hash(combined)};
            }
        }
        const auto meta = source + "|" + std::to_string(size) + "|" + std::to_string(mtime);
        return {FingerprintStrategy::Meta, crypto::hash_text(meta)};
    }

    std::string legacy_fingerprint(const std::filesystem::path &path)
    {
        return crypto::hash_text(canonical_source_path(path).generic_string());
    }

    std::filesystem::path canonical_source_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            absolute = path;
        }
        return absolute.lexically_normal();
    }

} // namespace tusc::client
