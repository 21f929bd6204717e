#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include <trs/core/result.hpp>

namespace trs::per {

// Default codec for BasicResultStore. T needs nlohmann to_json/from_json
// (e.g. NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE) or must be a type nlohmann maps natively.
struct JsonCodec {
    static constexpr const char* kExtension = "json";

    template<class T>
    static trs::core::Result<std::string> Encode(const T& value) noexcept {
        try {
            return nlohmann::json(value).dump(1, '\t');
        } catch (const nlohmann::json::exception& e) {
            return trs::core::ErrorCode(trs::core::StoreErrc::kSerialization, e.what());
        }
    }

    template<class T>
    static trs::core::Result<void> Decode(const std::string& data, T& out) noexcept {
        try {
            nlohmann::json::parse(data).get_to(out);
            return {};
        } catch (const nlohmann::json::exception& e) {
            return trs::core::ErrorCode(trs::core::StoreErrc::kCorruption, e.what());
        }
    }
};

} // namespace trs::per
