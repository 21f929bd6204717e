#include <persistency/storage_registry.hpp>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;
using trs::core::ErrorCode;
using trs::core::StoreErrc;

namespace persistency {

namespace {
// A temp file younger than this may belong to another process's save in progress.
constexpr std::int64_t kMinStaleTempThresholdS = 1;
}

StorageRegistry& StorageRegistry::Instance() {
    static StorageRegistry r;
    return r;
}

trs::core::Result<void> StorageRegistry::InitFromFile(const std::string& path) noexcept {
    std::ifstream in(path);
    if (!in) return ErrorCode(StoreErrc::kNotFound, "cannot open manifest " + path);

    std::ostringstream text;
    text << in.rdbuf();
    if (in.bad()) return ErrorCode(StoreErrc::kIoError, "cannot read manifest " + path);
    return InitFromString(text.str());
}

trs::core::Result<void> StorageRegistry::InitFromString(const std::string& manifest) noexcept {
    const json j = json::parse(manifest, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return ErrorCode(StoreErrc::kCorruption, "manifest is not a JSON object");
    }

    std::unordered_map<std::string, RecordStoreOptions> parsed;
    std::optional<trs::log::LogLevel> level;

    try {
        if (j.contains("log_level")) {
            const auto name = j.at("log_level").get<std::string>();
            level = trs::log::ParseLogLevel(name);
            if (!level) return ErrorCode(StoreErrc::kInvalidInput, "unknown log_level '" + name + "'");
        }

        for (const auto& s : j.at("storages")) {
            const std::string inst = s.at("instance_spec").get<std::string>();
            const auto threshold_s = s.value("stale_temp_threshold_s", std::int64_t{3600});
            const auto retries     = s.value("rename_max_retries", 5);
            const auto delay_ms    = s.value("rename_retry_delay_ms", std::int64_t{10});

            if (threshold_s < kMinStaleTempThresholdS) {
                return ErrorCode(StoreErrc::kInvalidInput,
                                 inst + ": stale_temp_threshold_s must be at least " +
                                     std::to_string(kMinStaleTempThresholdS));
            }
            if (retries < 1) {
                return ErrorCode(StoreErrc::kInvalidInput, inst + ": rename_max_retries must be at least 1");
            }
            if (delay_ms < 0) {
                return ErrorCode(StoreErrc::kInvalidInput, inst + ": rename_retry_delay_ms must not be negative");
            }

            RecordStoreOptions opts;
            opts.base_path            = s.value("base_path", std::string{});
            opts.stale_temp_threshold = std::chrono::seconds(threshold_s);
            opts.rename_max_retries   = retries;
            opts.rename_retry_delay   = std::chrono::milliseconds(delay_ms);
            opts.cleanup_on_start     = s.value("cleanup_on_start", true);

            if (!parsed.emplace(inst, std::move(opts)).second) {
                return ErrorCode(StoreErrc::kInvalidInput, "duplicate instance_spec '" + inst + "'");
            }
        }
    } catch (const json::exception& e) {
        return ErrorCode(StoreErrc::kCorruption, e.what());
    }

    std::lock_guard<std::mutex> lock(mtx_);
    map_ = std::move(parsed);
    log_level_ = level;
    inited_.store(true, std::memory_order_release);
    return {};
}

std::optional<RecordStoreOptions> StorageRegistry::Lookup(const std::string& instance) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = map_.find(instance);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

std::optional<trs::log::LogLevel> StorageRegistry::LogLevel() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return log_level_;
}

void StorageRegistry::Clear() noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    map_.clear();
    log_level_.reset();
    inited_.store(false, std::memory_order_release);
}

} // namespace persistency
