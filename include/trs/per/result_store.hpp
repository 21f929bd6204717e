#pragma once
#include <memory>
#include <string>
#include <utility>
#include <trs/core/result.hpp>
#include <trs/core/instance_specifier.hpp>
#include <trs/per/json_codec.hpp>
#include <persistency/record_store_backend.hpp>

namespace trs::per {

// Typed view over a RecordStoreBackend. Encoding and decoding happen outside
// the per-key lock; only file I/O runs under it.
template<class Codec>
class BasicResultStore {
public:
    explicit BasicResultStore(std::shared_ptr<persistency::RecordStoreBackend> backend)
        : backend_(std::move(backend)) {}

    template<class T>
    trs::core::Result<void> Save(const std::string& part1, const std::string& part2,
                                 const T& value) noexcept {
        auto encoded = Codec::Encode(value);
        if (!encoded.HasValue()) return encoded.Error();
        return backend_->WriteRecord(part1, part2, encoded.Value());
    }

    // *out is only assigned on success. kNotFound means the key was never saved.
    template<class T>
    trs::core::Result<void> Load(const std::string& part1, const std::string& part2,
                                 T* out) const noexcept {
        if (out == nullptr) {
            return trs::core::ErrorCode(trs::core::StoreErrc::kInvalidInput,
                                        "load destination must be a non-null pointer");
        }
        auto raw = backend_->ReadRecord(part1, part2);
        if (!raw.HasValue()) return raw.Error();

        T decoded{};
        auto r = Codec::Decode(raw.Value(), decoded);
        if (!r.HasValue()) return r.Error();
        *out = std::move(decoded);
        return {};
    }

    const std::string& BaseDir() const noexcept { return backend_->BaseDir(); }
    const std::shared_ptr<persistency::RecordStoreBackend>& Backend() const noexcept { return backend_; }

private:
    std::shared_ptr<persistency::RecordStoreBackend> backend_;
};

using ResultStore = BasicResultStore<JsonCodec>;
using SharedHandle = std::shared_ptr<ResultStore>;

// Registry-backed entry points. Every open of one instance returns the same
// handle while any caller still holds it, so they share one lock table.
trs::core::Result<SharedHandle> OpenResultStore(trs::core::InstanceSpecifier store) noexcept;
// Synchronous pass over the stale temp files of the instance
trs::core::Result<void> RecoverResultStore(trs::core::InstanceSpecifier store) noexcept;
// Deletes every record and temp file of the instance
trs::core::Result<void> ResetResultStore(trs::core::InstanceSpecifier store) noexcept;

} // namespace trs::per
