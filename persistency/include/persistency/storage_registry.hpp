#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <atomic>
#include <trs/core/result.hpp>
#include <persistency/record_store_backend.hpp>
#include "log.hpp"

namespace persistency {

// Maps instance specifiers ("Task/Results") to store options read from a JSON
// manifest:
//
//   { "log_level": "info",
//     "storages": [ { "instance_spec": "Task/Results", "base_path": "data",
//                     "stale_temp_threshold_s": 3600, "rename_max_retries": 5,
//                     "rename_retry_delay_ms": 10, "cleanup_on_start": true } ] }
class StorageRegistry {
public:
    static StorageRegistry& Instance();

    trs::core::Result<void> InitFromFile(const std::string& config_path) noexcept;
    trs::core::Result<void> InitFromString(const std::string& manifest) noexcept;

    std::optional<RecordStoreOptions> Lookup(const std::string& instance) const;

    // "log_level" of the manifest, if present and valid
    std::optional<trs::log::LogLevel> LogLevel() const;

    bool IsInitialized() const noexcept { return inited_.load(std::memory_order_acquire); }
    void Clear() noexcept;

private:
    StorageRegistry() = default;
    StorageRegistry(const StorageRegistry&) = delete;
    StorageRegistry& operator=(const StorageRegistry&) = delete;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, RecordStoreOptions> map_;
    std::optional<trs::log::LogLevel> log_level_;
    std::atomic<bool> inited_{false};
};

} // namespace persistency
