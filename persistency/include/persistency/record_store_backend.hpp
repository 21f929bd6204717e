#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <concurrency/keyed_mutex.hpp>
#include <trs/core/result.hpp>
#include "log.hpp"

namespace persistency {

struct RecordStoreOptions {
    std::string base_path;                      // empty -> kDefaultDirectory
    std::string record_prefix{"task"};
    std::string extension{"json"};
    std::chrono::seconds stale_temp_threshold{std::chrono::hours(1)};
    int rename_max_retries{5};
    std::chrono::milliseconds rename_retry_delay{10};
    bool cleanup_on_start{true};
};

// One file per (part1, part2) key under a single base directory. Writes go
// through a temp file + fsync + rename so a reader never sees half a record;
// reads and writes of the same key are serialized by a per-key lock.
class RecordStoreBackend {
public:
    static constexpr const char* kDefaultDirectory = "data";

    // Resolves base_path to an absolute path, creates it, and starts the
    // background sweep of stale temp files when cleanup_on_start is set.
    static trs::core::Result<std::shared_ptr<RecordStoreBackend>>
    Create(RecordStoreOptions options) noexcept;

    ~RecordStoreBackend();
    RecordStoreBackend(const RecordStoreBackend&) = delete;
    RecordStoreBackend& operator=(const RecordStoreBackend&) = delete;

    trs::core::Result<void> WriteRecord(const std::string& part1, const std::string& part2,
                                        const std::string& payload) noexcept;
    trs::core::Result<std::string> ReadRecord(const std::string& part1,
                                              const std::string& part2) const noexcept;

    // Absolute record path for the key, checked to stay inside BaseDir()
    trs::core::Result<std::string> ResolveRecordPath(const std::string& part1,
                                                     const std::string& part2) const noexcept;

    // Removes temp files older than the staleness threshold; returns how many went.
    // Temp files of saves still running in this process are never touched.
    std::size_t CleanupStaleTempFiles();
    void WaitForStartupCleanup();

    const std::string& BaseDir() const noexcept { return base_dir_; }
    const RecordStoreOptions& Options() const noexcept { return options_; }
    std::size_t ActiveLocks() const { return locks_.size(); }

private:
    RecordStoreBackend(RecordStoreOptions options, std::filesystem::path base_dir);

    void RunStartupCleanup_() noexcept;
    trs::core::Result<void> WriteAtomic_(const std::filesystem::path& target,
                                         const std::string& payload) noexcept;
    std::error_code RenameWithRetry_(const std::filesystem::path& from,
                                     const std::filesystem::path& to) noexcept;
    trs::core::Result<std::string> ReadWhole_(const std::filesystem::path& file) const noexcept;

    RecordStoreOptions options_;
    std::filesystem::path base_path_;
    std::string base_dir_;
    trs::log::Logger log_;
    mutable concurrency::KeyedMutex<std::string> locks_;

    // file names of temp files created by WriteAtomic_ and not yet renamed or removed
    std::mutex inflight_mu_;
    std::unordered_set<std::string> inflight_;
    std::thread cleanup_thread_;
};

} // namespace persistency
