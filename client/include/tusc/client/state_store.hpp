#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "tusc/client/file_identity.hpp"
#include "tusc/client/logger.hpp"
#include "tusc/http_message.hpp"

namespace tusc::client
{

    struct UploadState
    {
        std::string remote_url;
        // Last offset confirmed by the server, never an optimistic local value.
        std::uint64_t offset{};
        std::uint64_t file_size{};
        std::string endpoint;
        std::uint64_t chunk_size{};
        http::HeaderMap headers;
        std::chrono::system_clock::time_point saved_at{};
    };

    void to_json(nlohmann::json &json, const UploadState &state);
    void from_json(const nlohmann::json &json, UploadState &state);

    struct StateKey
    {
        FileFingerprint fingerprint;
        std::string legacy;
    };

    StateKey make_state_key(const std::filesystem::path &path, const FingerprintPolicy &policy = {});

    struct StateRecord
    {
        std::string name;
        std::string owner;
        std::chrono::system_clock::time_point modified{};
        bool legacy{};
    };

    // Records are named ".tusc_state_<fingerprint>_<owner>.json". Each owner
    // (one per process) writes only its own slot; other slots are read during
    // discovery and removed only once they are demonstrably stale.
    class StateStore
    {
    public:
        explicit StateStore(std::string owner, Logger logger = {});
        virtual ~StateStore() = default;

        StateStore(const StateStore &) = delete;
        StateStore &operator=(const StateStore &) = delete;

        const std::string &owner() const noexcept { return owner_; }
        std::string record_name(const StateKey &key) const;

        // Stamps saved_at and atomically replaces this owner's record.
        void save(const StateKey &key, UploadState &state);

        // Own record first, then the newest record of any owner (current or
        // legacy naming). Only records whose file size matches are returned.
        // Never throws on bad data.
        std::optional<UploadState> load(const StateKey &key, std::uint64_t file_size) const;

        // Removes the own record, records older than `retention`, and records
        // that point at `completed_url`.
        void clear(const StateKey &key, std::chrono::seconds retention,
                   const std::optional<std::string> &completed_url = std::nullopt);

        // Removes every record of any owner that points at `remote_url`.
        void discard(const StateKey &key, const std::string &remote_url);

        std::vector<StateRecord> records(const StateKey &key) const;

        void remove(const StateRecord &record);

    protected:
        struct Slot
        {
            std::string name;
            std::chrono::system_clock::time_point modified{};
        };

        virtual void write_record(const std::string &name, const std::string &contents) = 0;
        virtual std::optional<std::string> read_record(const std::string &name) const = 0;
        virtual std::vector<Slot> list_records(std::string_view prefix) const = 0;
        virtual void remove_record(const std::string &name) = 0;

    private:
        std::optional<UploadState> decode(const std::string &name) const;

        std::string owner_;
        mutable Logger logger_;
    };

    class DirectoryStateStore : public StateStore
    {
    public:
        DirectoryStateStore(std::filesystem::path directory, std::string owner, Logger logger = {});

        static std::filesystem::path default_directory();

        const std::filesystem::path &directory() const noexcept { return directory_; }

    protected:
        void write_record(const std::string &name, const std::string &contents) override;
        std::optional<std::string> read_record(const std::string &name) const override;
        std::vector<Slot> list_records(std::string_view prefix) const override;
        void remove_record(const std::string &name) override;

    private:
        std::filesystem::path directory_;
    };

    // Several stores may share one backing to stand in for several processes.
    class MemoryStateStore : public StateStore
    {
    public:
        struct Backing
        {
            struct Entry
            {
                std::string contents;
                std::chrono::system_clock::time_point modified{};
            };

            mutable std::mutex mutex;
            std::map<std::string, Entry> records;
        };

        explicit MemoryStateStore(std::string owner, std::shared_ptr<Backing> backing = std::make_shared<Backing>(),
                                  Logger logger = {});

        const std::shared_ptr<Backing> &backing() const noexcept { return backing_; }

        std::vector<std::string> names() const;
        std::optional<std::string> contents(const std::string &name) const;
        void put(const std::string &name, std::string contents);
        void age(const std::string &name, std::chrono::seconds by);

    protected:
        void write_record(const std::string &name, const std::string &contents) override;
        std::optional<std::string> read_record(const std::string &name) const override;
        std::vector<Slot> list_records(std::string_view prefix) const override;
        void remove_record(const std::string &name) override;

    private:
        std::shared_ptr<Backing> backing_;
    };

} // namespace tusc::client
