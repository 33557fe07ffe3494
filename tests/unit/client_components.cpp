#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "tusc/client/concurrency_guard.hpp"
#include "tusc/client/config.hpp"
#include "tusc/client/file_identity.hpp"
#include "tusc/client/process_probe.hpp"
#include "tusc/client/state_store.hpp"
#include "tusc/client/transfer_engine.hpp"
#include "tusc/crypto.hpp"
#include "tusc/error_codes.hpp"

using namespace tusc;
using namespace tusc::client;

namespace
{

    constexpr std::uint64_t kMiB = 1024ULL * 1024;

    class FakeProbe : public ProcessProbe
    {
    public:
        explicit FakeProbe(std::set<std::string> alive) : alive_(std::move(alive)) {}

        bool is_alive(const std::string &owner) const override
        {
            return alive_.contains(owner);
        }

    private:
        std::set<std::string> alive_;
    };

    std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
        return path;
    }

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, const std::string &contents)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << contents;
    }

    void make_sparse_file(const std::filesystem::path &path, std::uint64_t size)
    {
        write_file(path, "");
        std::filesystem::resize_file(path, size);
    }

    UploadState sample_state(std::uint64_t offset, std::uint64_t size)
    {
        UploadState state;
        state.remote_url = "http://localhost:1080/files/abc";
        state.offset = offset;
        state.file_size = size;
        state.endpoint = "http://localhost:1080/files/";
        state.chunk_size = 1024;
        state.headers["Authorization"] = "Bearer token";
        return state;
    }

    template <typename Fn>
    bool throws_config_error(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const TransferError &ex)
        {
            return ex.code() == ErrorCode::InvalidConfig;
        }
        return false;
    }

    ClientConfig parse(std::vector<std::string> args, const std::map<std::string, std::string> &env = {})
    {
        args.insert(args.begin(), "tusc");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        const EnvLookup lookup = [env](const std::string &name) -> std::optional<std::string>
        {
            const auto it = env.find(name);
            if (it == env.end())
            {
                return std::nullopt;
            }
            return it->second;
        };
        return parse_arguments(static_cast<int>(args.size()), argv.data(), lookup);
    }

    void test_fingerprint_full_tier()
    {
        const auto root = fresh_directory("tusc_fingerprint_full");
        const auto file = root / "notes.txt";
        write_file(file, "first version");

        const auto first = compute_fingerprint(file);
        assert(first.strategy == FingerprintStrategy::Full);
        assert(first.digest == crypto::hash_text("first version"));
        assert(compute_fingerprint(file) == first);
        assert(compute_fingerprint(root / "." / "notes.txt") == first);

        write_file(file, "first versioN");
        const auto changed = compute_fingerprint(file);
        assert(changed.strategy == FingerprintStrategy::Full);
        assert(!(changed == first));

        assert(first.to_string() == "full_" + first.digest);
        assert(!(FileFingerprint{FingerprintStrategy::Meta, first.digest} == first));

        cleanup_path(root);
    }

    void test_fingerprint_boundaries()
    {
        const auto root = fresh_directory("tusc_fingerprint_tiers");

        const auto at_limit = root / "at_limit.bin";
        make_sparse_file(at_limit, 50 * kMiB);
        assert(compute_fingerprint(at_limit).strategy == FingerprintStrategy::Full);

        const auto over_limit = root / "over_limit.bin";
        make_sparse_file(over_limit, 50 * kMiB + 1);
        const auto hybrid = compute_fingerprint(over_limit);
        assert(hybrid.strategy == FingerprintStrategy::Hybrid);
        assert(hybrid.digest.size() == 16);
        assert(compute_fingerprint(over_limit) == hybrid);

        const auto huge = root / "huge.bin";
        make_sparse_file(huge, 500 * kMiB + 1);
        const auto meta = compute_fingerprint(huge);
        assert(meta.strategy == FingerprintStrategy::Meta);
        assert(compute_fingerprint(huge) == meta);

        // Thresholds are policy, not constants.
        FingerprintPolicy tight;
        tight.full_hash_limit = 4;
        tight.hybrid_limit = 8;
        const auto small = root / "small.bin";
        write_file(small, "123456");
        assert(compute_fingerprint(small, tight).strategy == FingerprintStrategy::Hybrid);
        write_file(small, "123456789");
        assert(compute_fingerprint(small, tight).strategy == FingerprintStrategy::Meta);

        cleanup_path(root);
    }

    void test_fingerprint_path_fallback()
    {
        const auto missing = std::filesystem::temp_directory_path() / "tusc_missing_dir" / "absent.bin";
        const auto fingerprint = compute_fingerprint(missing);
        assert(fingerprint.strategy == FingerprintStrategy::Path);
        assert(fingerprint.digest == crypto::hash_text(canonical_source_path(missing).generic_string()));
        assert(legacy_fingerprint(missing) == fingerprint.digest);
        assert(canonical_source_path("a/../b.bin") == canonical_source_path("b.bin"));
    }

    void test_directory_state_store()
    {
        const auto root = fresh_directory("tusc_state_directory");
        const auto file = root / "payload.bin";
        write_file(file, std::string(4096, 'x'));
        const auto state_dir = root / "state";
        const auto key = make_state_key(file);

        DirectoryStateStore mine(state_dir, "100");
        assert(!mine.load(key, 4096));

        auto state = sample_state(1024, 4096);
        mine.save(key, state);
        assert(state.saved_at.time_since_epoch().count() != 0);
        const auto own_name = ".tusc_state_" + key.fingerprint.to_string() + "_100.json";
        assert(mine.record_name(key) == own_name);
        assert(std::filesystem::exists(state_dir / own_name));
        for (const auto &entry : std::filesystem::directory_iterator(state_dir))
        {
            assert(entry.path().filename().string().find(".tmp-") == std::string::npos);
        }

        const auto loaded = mine.load(key, 4096);
        assert(loaded);
        assert(loaded->offset == 1024);
        assert(loaded->remote_url == state.remote_url);
        assert(loaded->headers.at("authorization") == "Bearer token");
        assert(!mine.load(key, 4097));

        // Another process discovers the record through the shared namespace.
        DirectoryStateStore other(state_dir, "200");
        const auto discovered = other.load(key, 4096);
        assert(discovered && discovered->offset == 1024);

        // Corrupt and inconsistent records are treated as absent.
        write_file(state_dir / (".tusc_state_" + key.fingerprint.to_string() + "_300.json"), "{not json");
        auto inconsistent = nlohmann::json(sample_state(9000, 4096));
        write_file(state_dir / (".tusc_state_" + key.fingerprint.to_string() + "_301.json"), inconsistent.dump());
        write_file(state_dir / (".tusc_state_" + key.fingerprint.to_string() + "_100.json"), "garbage");
        const auto after_corruption = other.load(key, 4096);
        assert(!after_corruption);

        // Records under the old path-only naming are still discovered.
        auto legacy = nlohmann::json(sample_state(2048, 4096));
        legacy["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::system_clock::now().time_since_epoch())
                                  .count();
        write_file(state_dir / (".tusc_state_" + key.legacy + "_400.json"), legacy.dump());
        const auto from_legacy = other.load(key, 4096);
        assert(from_legacy && from_legacy->offset == 2048);
        const auto records = other.records(key);
        assert(records.size() == 4);
        bool saw_legacy = false;
        for (const auto &record : records)
        {
            saw_legacy = saw_legacy || (record.legacy && record.owner == "400");
        }
        assert(saw_legacy);

        cleanup_path(root);
    }

    void test_directory_state_store_clear()
    {
        const auto root = fresh_directory("tusc_state_clear");
        const auto file = root / "payload.bin";
        write_file(file, "payload");
        const auto state_dir = root / "state";
        const auto key = make_state_key(file);

        DirectoryStateStore mine(state_dir, "100");
        DirectoryStateStore recent(state_dir, "200");
        DirectoryStateStore stale(state_dir, "300");
        DirectoryStateStore finished(state_dir, "400");

        auto state = sample_state(3, 7);
        mine.save(key, state);
        recent.save(key, state);
        stale.save(key, state);
        auto other_upload = sample_state(3, 7);
        other_upload.remote_url = "http://localhost:1080/files/other";
        finished.save(key, other_upload);

        std::filesystem::last_write_time(state_dir / stale.record_name(key),
                                         std::filesystem::file_time_type::clock::now() - std::chrono::hours(2));

        mine.clear(key, std::chrono::hours(1));
        assert(!std::filesystem::exists(state_dir / mine.record_name(key)));
        assert(std::filesystem::exists(state_dir / recent.record_name(key)));
        assert(!std::filesystem::exists(state_dir / stale.record_name(key)));
        assert(std::filesystem::exists(state_dir / finished.record_name(key)));

        // Completion also drops records pointing at the finished upload.
        mine.clear(key, std::chrono::hours(1), state.remote_url);
        assert(!std::filesystem::exists(state_dir / recent.record_name(key)));
        assert(std::filesystem::exists(state_dir / finished.record_name(key)));

        cleanup_path(root);
    }

    void test_state_store_owner_validation()
    {
        bool empty_rejected = false;
        try
        {
            MemoryStateStore store("");
        }
        catch (const std::invalid_argument &)
        {
            empty_rejected = true;
        }
        assert(empty_rejected);

        bool separator_rejected = false;
        try
        {
            MemoryStateStore store("12_34");
        }
        catch (const std::invalid_argument &)
        {
            separator_rejected = true;
        }
        assert(separator_rejected);
    }

    void test_memory_state_store()
    {
        const StateKey key{FileFingerprint{FingerprintStrategy::Full, "abcdef"}, "legacyhash"};
        auto backing = std::make_shared<MemoryStateStore::Backing>();
        MemoryStateStore first("1", backing);
        MemoryStateStore second("2", backing);

        auto state = sample_state(100, 1000);
        first.save(key, state);
        assert(first.names().size() == 1);
        assert(first.names().front() == ".tusc_state_full_abcdef_1.json");

        // Saved timestamps have millisecond resolution.
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto newer = sample_state(300, 1000);
        newer.remote_url = "http://localhost:1080/files/newer";
        second.save(key, newer);

        // Own record wins over a newer foreign one.
        assert(first.load(key, 1000)->offset == 100);

        MemoryStateStore third("3", backing);
        third.put(".tusc_state_full_abcdef_9.json", "[1, 2");
        const auto adopted = third.load(key, 1000);
        assert(adopted && adopted->remote_url == newer.remote_url);

        // Hybrid-tagged records never match a full-tagged key.
        const StateKey other_tier{FileFingerprint{FingerprintStrategy::Hybrid, "abcdef"}, ""};
        assert(!third.load(other_tier, 1000));
        assert(third.records(other_tier).empty());

        third.age(".tusc_state_full_abcdef_9.json", std::chrono::hours(3));
        second.age(second.record_name(key), std::chrono::hours(3));
        first.clear(key, std::chrono::hours(1));
        assert(backing->records.empty());
    }

    void test_concurrency_guard()
    {
        const StateKey key{FileFingerprint{FingerprintStrategy::Full, "0123"}, ""};
        auto backing = std::make_shared<MemoryStateStore::Backing>();
        MemoryStateStore self("10", backing);
        MemoryStateStore live("20", backing);
        MemoryStateStore dead("30", backing);
        MemoryStateStore idle("40", backing);

        auto state = sample_state(0, 10);
        const FakeProbe probe({"10", "20", "40"});
        ConcurrencyGuard guard(self, probe);

        self.save(key, state);
        const auto alone = guard.check_active(key);
        assert(alone.active == 0);
        assert(!alone.warning);

        live.save(key, state);
        dead.save(key, state);
        idle.save(key, state);
        idle.age(idle.record_name(key), std::chrono::minutes(10));

        const auto report = guard.check_active(key);
        assert(report.active == 1);
        assert(report.warning);
        assert(report.warning->find("1 other active upload") != std::string::npos);

        const auto names = self.names();
        assert(names.size() == 3);
        assert(!self.contents(dead.record_name(key)));
        assert(self.contents(idle.record_name(key)));
        assert(self.contents(self.record_name(key)));
    }

    void test_process_probe()
    {
        const auto probe = make_default_process_probe();
        assert(probe->is_alive(current_process_owner()));

        const SignalProcessProbe signal_probe;
        assert(!signal_probe.is_alive("not-a-pid"));
        assert(!signal_probe.is_alive("0"));
        assert(!signal_probe.is_alive("99999999999"));
        assert(AssumeAliveProcessProbe().is_alive("anything"));
    }

    void test_timeout_policy()
    {
        using std::chrono::seconds;
        assert(compute_request_timeout(2 * kMiB, 10 * kMiB) == seconds(60));
        assert(compute_request_timeout(32 * kMiB, 10 * kMiB) == seconds(190));
        assert(compute_request_timeout(32 * kMiB, 1024 * kMiB + 1) == seconds(200));
        assert(compute_request_timeout(32 * kMiB, 200ULL * 1024 * kMiB) == seconds(1800));
        assert(compute_request_timeout(64 * 1024, 1024 * kMiB) == seconds(60));

        TimeoutPolicy generous;
        generous.minimum = seconds(1);
        assert(compute_request_timeout(2 * kMiB, kMiB, generous) == seconds(40));
    }

    void test_backoff_and_checkpoint()
    {
        using std::chrono::milliseconds;
        using std::chrono::seconds;
        const milliseconds base = seconds(1);
        const milliseconds cap = seconds(30);
        assert(backoff_delay(0, base, cap) == seconds(1));
        assert(backoff_delay(1, base, cap) == seconds(2));
        assert(backoff_delay(4, base, cap) == seconds(16));
        assert(backoff_delay(5, base, cap) == seconds(30));
        assert(backoff_delay(60, base, cap) == seconds(30));

        milliseconds total{0};
        for (unsigned i = 0; i < 8; ++i)
        {
            total += backoff_delay(i, base, cap);
        }
        assert(total == seconds(1 + 2 + 4 + 8 + 16 + 30 + 30 + 30));

        assert(checkpoint_interval(10 * kMiB, 2 * kMiB, 10 * kMiB) == 10 * kMiB);
        assert(checkpoint_interval(1024 * kMiB, 2 * kMiB, 10 * kMiB) == 1024 * kMiB / 20);
        assert(checkpoint_interval(100 * kMiB, 32 * kMiB, 10 * kMiB) == 64 * kMiB);
    }

    void test_config_from_environment()
    {
        const auto config = parse({"movie.mkv"}, {
                                                     {"TUSC_ENDPOINT", "http://localhost:1080/files/"},
                                                     {"TUSC_CHUNK_SIZE", "0.5"},
                                                     {"TUSC_HEADERS", "Authorization:Bearer abc, X-Trace: 7"},
                                                     {"TUSC_RETRIES", "3"},
                                                     {"TUSC_STATE_DIR", "/tmp/tusc-state"},
                                                 });
        assert(config.endpoint == "http://localhost:1080/files/");
        assert(config.chunk_size == 512 * 1024);
        assert(config.headers.size() == 2);
        assert(config.headers.at("authorization") == "Bearer abc");
        assert(config.headers.at("X-Trace") == "7");
        assert(config.max_retries == 3);
        assert(config.state_dir == std::optional<std::filesystem::path>("/tmp/tusc-state"));
        assert(config.file == std::optional<std::filesystem::path>("movie.mkv"));
        assert(config.warnings.empty());

        const auto options = to_transfer_options(config);
        assert(options.endpoint == config.endpoint);
        assert(options.chunk_size == config.chunk_size);
        assert(options.max_retries == 3);
        assert(!options.reset);
    }

    void test_config_flags_and_clamping()
    {
        const auto config = parse({"-t", "https://uploads.example.com/files/", "-c", "64", "--retries", "20",
                                   "-H", "X-Api-Key: secret", "--header", "X-Other:1", "-r", "-v", "--log",
                                   "tusc.log", "data.bin"},
                                  {{"TUSC_ENDPOINT", "http://ignored/"}, {"TUSC_CHUNK_SIZE", "1"}});
        assert(config.endpoint == "https://uploads.example.com/files/");
        assert(config.chunk_size == kMaxChunkSize);
        assert(config.max_retries == kMaxRetries);
        assert(config.warnings.size() == 2);
        assert(config.headers.at("x-api-key") == "secret");
        assert(config.headers.at("X-Other") == "1");
        assert(config.reset);
        assert(config.verbose);
        assert(config.log_path == std::optional<std::filesystem::path>("tusc.log"));

        const auto tiny = parse({"-t", "http://localhost/files/", "-c", "0.01", "a.bin"});
        assert(tiny.chunk_size == kMinChunkSize);
        assert(tiny.warnings.size() == 1);

        const auto defaults = parse({"-t", "http://localhost/files/", "a.bin"});
        assert(defaults.chunk_size == kDefaultChunkSize);
        assert(defaults.max_retries == kDefaultRetries);
        assert(!defaults.reset);

        assert(parse({"--help"}).show_help);
        assert(parse({"--version"}).show_version);
        const auto options_only = parse({"-o", "-t", "http://localhost/files/"});
        assert(options_only.query_options && !options_only.file);
    }

    void test_config_rejects_invalid_input()
    {
        const std::map<std::string, std::string> env{{"TUSC_ENDPOINT", "http://localhost/files/"}};
        assert(throws_config_error([] { parse({"a.bin"}); }));
        assert(throws_config_error([] { parse({"-t", "ftp://localhost/", "a.bin"}); }));
        assert(throws_config_error([&] { parse({"-c", "abc", "a.bin"}, env); }));
        assert(throws_config_error([&] { parse({"-c", "-1", "a.bin"}, env); }));
        assert(throws_config_error([&] { parse({"--retries", "many", "a.bin"}, env); }));
        assert(throws_config_error([&] { parse({"-H", "no separator", "a.bin"}, env); }));
        assert(throws_config_error([&] { parse({"--bogus", "a.bin"}, env); }));
        assert(throws_config_error([&] { parse({"a.bin", "b.bin"}, env); }));
        assert(throws_config_error([&] { parse({"a.bin", "-t"}, env); }));
        assert(throws_config_error([&] { parse({}, env); }));
        assert(throws_config_error([] { parse({"a.bin"}, {{"TUSC_CHUNK_SIZE", "zero"}}); }));
    }

} // namespace

void run_client_component_tests()
{
    test_fingerprint_full_tier();
    test_fingerprint_boundaries();
    test_fingerprint_path_fallback();
    test_directory_state_store();
    test_directory_state_store_clear();
    test_state_store_owner_validation();
    test_memory_state_store();
    test_concurrency_guard();
    test_process_probe();
    test_timeout_policy();
    test_backoff_and_checkpoint();
    test_config_from_environment();
    test_config_flags_and_clamping();
    test_config_rejects_invalid_input();
}
