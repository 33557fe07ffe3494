#include "tusc/client/state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace tusc::client
{

    namespace
    {
        constexpr std::string_view kRecordPrefix = ".tusc_state_";
        constexpr std::string_view kRecordSuffix = ".json";

        std::string namespace_prefix(std::string_view fingerprint)
        {
            std::string prefix(kRecordPrefix);
            prefix.append(fingerprint).push_back('_');
            return prefix;
        }

        std::int64_t to_millis(std::chrono::system_clock::time_point time)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point from_millis(std::int64_t millis)
        {
            return std::chrono::system_clock::time_point{
                std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds{millis})};
        }

    } // namespace

    void to_json(nlohmann::json &json, const UploadState &state)
    {
        nlohmann::json headers = nlohmann::json::object();
        for (const auto &[name, value] : state.headers)
        {
            headers[name] = value;
        }
        json = {
            {"url", state.remote_url},
            {"offset", state.offset},
            {"file_size", state.file_size},
            {"endpoint", state.endpoint},
            {"chunk_size", state.chunk_size},
            {"headers", headers},
            {"timestamp", to_millis(state.saved_at)},
        };
    }

    void from_json(const nlohmann::json &json, UploadState &state)
    {
        state.remote_url = json.at("url").get<std::string>();
        state.offset = json.at("offset").get<std::uint64_t>();
        state.file_size = json.at("file_size").get<std::uint64_t>();
        state.endpoint = json.at("endpoint").get<std::string>();
        state.chunk_size = json.value("chunk_size", 0ULL);
        state.headers.clear();
        if (const auto it = json.find("headers"); it != json.end() && it->is_object())
        {
            for (const auto &[name, value] : it->items())
            {
                state.headers[name] = value.get<std::string>();
            }
        }
        state.saved_at = from_millis(json.value("timestamp", std::int64_t{0}));
    }

    StateKey make_state_key(const std::filesystem::path &path, const FingerprintPolicy &policy)
    {
        return StateKey{compute_fingerprint(path, policy), legacy_fingerprint(path)};
    }

    StateStore::StateStore(std::string owner, Logger logger)
        : owner_(std::move(owner)),
          logger_(std::move(logger))
    {
        if (owner_.empty() || owner_.find('_') != std::string::npos)
        {
            throw std::invalid_argument("State owner must be non-empty and free of '_'");
        }
    }

    std::string StateStore::record_name(const StateKey &key) const
    {
        return namespace_prefix(key.fingerprint.to_string()) + owner_ + std::string(kRecordSuffix);
    }

    void StateStore::save(const StateKey &key, UploadState &state)
    {
        state.saved_at = std::chrono::system_clock::now();
        const auto name = record_name(key);
        write_record(name, nlohmann::json(state).dump(2));
        logger_.log("state", "saved ", name, " offset=", state.offset);
    }

    std::optional<UploadState> StateStore::load(const StateKey &key, std::uint64_t file_size) const
    {
        const auto own = record_name(key);
        if (auto state = decode(own); state && state->file_size == file_size)
        {
            return state;
        }

        std::optional<UploadState> newest;
        std::string newest_name;
        for (const auto &record : records(key))
        {
            if (record.name == own)
            {
                continue;
            }
            auto candidate = decode(record.name);
            if (!candidate || candidate->file_size != file_size)
            {
                continue;
            }
            if (!newest || candidate->saved_at > newest->saved_at)
            {
                newest = std::move(candidate);
                newest_name = record.name;
            }
        }
        if (newest)
        {
            logger_.log("state", "adopted ", newest_name, " offset=", newest->offset);
        }
        return newest;
    }

    void StateStore::clear(const StateKey &key, std::chrono::seconds retention,
                           const std::optional<std::string> &completed_url)
    {
        const auto own = record_name(key);
        remove_record(own);

        const auto now = std::chrono::system_clock::now();
        for (const auto &record : records(key))
        {
            if (record.name == own)
            {
                continue;
            }
            bool stale = now - record.modified > retention;
            if (!stale && completed_url)
            {
                const auto state = decode(record.name);
                stale = state && state->remote_url == *completed_url;
            }
            if (stale)
            {
                remove(record);
            }
        }
    }

    void StateStore::discard(const StateKey &key, const std::string &remote_url)
    {
        for (const auto &record : records(key))
        {
            const auto state = decode(record.name);
            if (state && state->remote_url == remote_url)
            {
                remove(record);
            }
        }
    }

    std::vector<StateRecord> StateStore::records(const StateKey &key) const
    {
        std::vector<StateRecord> result;
        const auto collect = [&](const std::string &prefix, bool legacy)
        {
            for (auto &slot : list_records(prefix))
            {
                if (slot.name.size() <= prefix.size() + kRecordSuffix.size())
                {
                    continue;
                }
                auto owner = slot.name.substr(prefix.size(), slot.name.size() - prefix.size() - kRecordSuffix.size());
                if (owner.find('_') != std::string::npos)
                {
                    continue;
                }
                result.push_back(StateRecord{std::move(slot.name), std::move(owner), slot.modified, legacy});
            }
        };
        collect(namespace_prefix(key.fingerprint.to_string()), false);
        if (!key.legacy.empty())
        {
            collect(namespace_prefix(key.legacy), true);
        }
        return result;
    }

    void StateStore::remove(const StateRecord &record)
    {
        remove_record(record.name);
        logger_.log("state", "removed ", record.name);
    }

    std::optional<UploadState> StateStore::decode(const std::string &name) const
    {
        const auto contents = read_record(name);
        if (!contents)
        {
            return std::nullopt;
        }
        try
        {
            auto state = nlohmann::json::parse(*contents).get<UploadState>();
            if (state.remote_url.empty() || state.offset > state.file_size)
            {
                logger_.warn("state", "ignoring inconsistent record ", name);
                return std::nullopt;
            }
            return state;
        }
        catch (const nlohmann::json::exception &ex)
        {
            logger_.warn("state", "ignoring unreadable record ", name, ": ", ex.what());
            return std::nullopt;
        }
    }

    DirectoryStateStore::DirectoryStateStore(std::filesystem::path directory, std::string owner, Logger logger)
        : StateStore(std::move(owner), std::move(logger)),
          directory_(std::move(directory)) {}

    std::filesystem::path DirectoryStateStore::default_directory()
    {
#ifdef _WIN32
        if (const char *appdata = std::getenv("APPDATA"))
        {
            return std::filesystem::path(appdata) / "tusc" / "state";
        }
#endif
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".tusc" / "state";
        }
        return std::filesystem::path(".tusc") / "state";
    }

    void DirectoryStateStore::write_record(const std::string &name, const std::string &contents)
    {
        std::filesystem::create_directories(directory_);
        const auto target = directory_ / name;
        auto temp = directory_ / (name + ".tmp-" + owner());
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to open state file for writing: " + temp.string());
            }
            out << contents;
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                throw std::runtime_error("Failed to write state file: " + temp.string());
            }
        }
        // rename() replaces the target atomically, so readers see either the
        // previous record or the new one.
        std::filesystem::rename(temp, target);
    }

    std::optional<std::string> DirectoryStateStore::read_record(const std::string &name) const
    {
        std::ifstream in(directory_ / name, std::ios::binary);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::vector<StateStore::Slot> DirectoryStateStore::list_records(std::string_view prefix) const
    {
        std::vector<Slot> slots;
        std::error_code ec;
        std::filesystem::directory_iterator it(directory_, ec);
        if (ec)
        {
            return slots;
        }
        for (const auto &entry : it)
        {
            const auto name = entry.path().filename().string();
            if (!name.starts_with(prefix) || !name.ends_with(kRecordSuffix))
            {
                continue;
            }
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec))
            {
                continue;
            }
            const auto written = entry.last_write_time(entry_ec);
            if (entry_ec)
            {
                continue;
            }
            slots.push_back(Slot{
                name,
                std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    std::chrono::file_clock::to_sys(written)),
            });
        }
        return slots;
    }

    void DirectoryStateStore::remove_record(const std::string &name)
    {
        std::error_code ec;
        std::filesystem::remove(directory_ / name, ec);
    }

    MemoryStateStore::MemoryStateStore(std::string owner, std::shared_ptr<Backing> backing, Logger logger)
        : StateStore(std::move(owner), std::move(logger)),
          backing_(std::move(backing)) {}

    std::vector<std::string> MemoryStateStore::names() const
    {
        std::lock_guard lock(backing_->mutex);
        std::vector<std::string> result;
        for (const auto &[name, entry] : backing_->records)
        {
            result.push_back(name);
        }
        return result;
    }

    std::optional<std::string> MemoryStateStore::contents(const std::string &name) const
    {
        return read_record(name);
    }

    void MemoryStateStore::put(const std::string &name, std::string contents)
    {
        write_record(name, contents);
    }

    void MemoryStateStore::age(const std::string &name, std::chrono::seconds by)
    {
        std::lock_guard lock(backing_->mutex);
        const auto it = backing_->records.find(name);
        if (it != backing_->records.end())
        {
            it->second.modified -= by;
        }
    }

    void MemoryStateStore::write_record(const std::string &name, const std::string &contents)
    {
        std::lock_guard lock(backing_->mutex);
        backing_->records[name] = Backing::Entry{contents, std::chrono::system_clock::now()};
    }

    std::optional<std::string> MemoryStateStore::read_record(const std::string &name) const
    {
        std::lock_guard lock(backing_->mutex);
        const auto it = backing_->records.find(name);
        if (it == backing_->records.end())
        {
            return std::nullopt;
        }
        return it->second.contents;
    }

    std::vector<StateStore::Slot> MemoryStateStore::list_records(std::string_view prefix) const
    {
        std::lock_guard lock(backing_->mutex);
        std::vector<Slot> slots;
        for (const auto &[name, entry] : backing_->records)
        {
            if (name.starts_with(prefix) && name.ends_with(kRecordSuffix))
            {
                slots.push_back(Slot{name, entry.modified});
            }
        }
        return slots;
    }

    void MemoryStateStore::remove_record(const std::string &name)
    {
        std::lock_guard lock(backing_->mutex);
        backing_->records.erase(name);
    }

} // namespace tusc::client
