#include <trs/per/result_store.hpp>
#include <persistency/record_filename.hpp>
#include <persistency/storage_registry.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>

using persistency::RecordStoreBackend;
using persistency::RecordStoreOptions;
using persistency::StorageRegistry;
using trs::core::ErrorCode;
using trs::core::StoreErrc;

namespace {

std::mutex g_open_mtx;
std::unordered_map<std::string, std::weak_ptr<trs::per::ResultStore>> g_open;

trs::core::Result<RecordStoreOptions> LookupOptions(const trs::core::InstanceSpecifier& store) {
    auto& reg = StorageRegistry::Instance();
    if (!reg.IsInitialized()) {
        return ErrorCode(StoreErrc::kUnknown, "storage registry is not initialized");
    }
    auto cfg = reg.Lookup(store.ToString());
    if (!cfg) {
        return ErrorCode(StoreErrc::kNotFound, "no storage configured for " + store.ToString());
    }
    cfg->extension = trs::per::JsonCodec::kExtension;
    return *cfg;
}

bool IsRecordFileName(const std::string& name, const RecordStoreOptions& opts) {
    const std::string head = opts.record_prefix + "-";
    const std::string tail = "." + opts.extension;
    return name.size() > head.size() + tail.size() &&
           name.compare(0, head.size(), head) == 0 &&
           name.compare(name.size() - tail.size(), tail.size(), tail) == 0;
}

} // namespace

namespace trs::per {

trs::core::Result<SharedHandle> OpenResultStore(trs::core::InstanceSpecifier store) noexcept {
    auto cfg = LookupOptions(store);
    if (!cfg) return cfg.Error();

    std::lock_guard<std::mutex> lock(g_open_mtx);
    auto& slot = g_open[store.ToString()];
    if (auto existing = slot.lock()) {
        return existing;
    }

    auto backend = RecordStoreBackend::Create(std::move(cfg.Value()));
    if (!backend) return backend.Error();

    auto handle = std::make_shared<ResultStore>(std::move(backend.Value()));
    slot = handle;
    return handle;
}

trs::core::Result<void> RecoverResultStore(trs::core::InstanceSpecifier store) noexcept {
    auto h = OpenResultStore(store);
    if (!h) return h.Error();
    try {
        h.Value()->Backend()->CleanupStaleTempFiles();
    } catch (const std::exception& e) {
        return ErrorCode(StoreErrc::kUnknown, std::string("temp file recovery failed: ") + e.what());
    }
    return {};
}

trs::core::Result<void> ResetResultStore(trs::core::InstanceSpecifier store) noexcept {
    namespace fs = std::filesystem;
    auto cfg = LookupOptions(store);
    if (!cfg) return cfg.Error();
    const RecordStoreOptions& opts = cfg.Value();

    std::error_code ec;
    const fs::path base = fs::absolute(
        opts.base_path.empty() ? fs::path(RecordStoreBackend::kDefaultDirectory) : fs::path(opts.base_path), ec);
    if (ec) return ErrorCode(StoreErrc::kIoError, "resolve " + opts.base_path + ": " + ec.message());
    if (!fs::exists(base, ec)) return {};

    for (fs::directory_iterator it(base, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        const std::string name = it->path().filename().string();
        if (!IsRecordFileName(name, opts) && !persistency::IsTempFileName(name)) continue;
        fs::remove(it->path(), entry_ec);
        if (entry_ec) {
            return ErrorCode(StoreErrc::kIoError, "remove " + it->path().string() + ": " + entry_ec.message());
        }
    }
    if (ec) return ErrorCode(StoreErrc::kIoError, "list " + base.string() + ": " + ec.message());
    return {};
}

} // namespace trs::per
