#pragma once
#include <variant>
#include <string>
#include <string_view>
#include <utility>

namespace trs::core {

// Error domain shared by the store, the registry and the codecs
enum class StoreErrc {
    kSuccess = 0,
    kInvalidInput,
    kNotFound,
    kIoError,
    kPathEscape,
    kSerialization,
    kCorruption,
    kUnknown
};

inline constexpr std::string_view ToString(StoreErrc e) {
    switch (e) {
        case StoreErrc::kSuccess:       return "Success";
        case StoreErrc::kInvalidInput:  return "InvalidInput";
        case StoreErrc::kNotFound:      return "NotFound";
        case StoreErrc::kIoError:       return "IoError";
        case StoreErrc::kPathEscape:    return "PathEscape";
        case StoreErrc::kSerialization: return "Serialization";
        case StoreErrc::kCorruption:    return "Corruption";
        default:                        return "Unknown";
    }
}

class ErrorCode {
public:
    StoreErrc value;
    std::string message;   // diagnostic detail, usually "<operation> <path>: <os error>"

    ErrorCode(StoreErrc v) : value(v) {}
    ErrorCode(StoreErrc v, std::string msg) : value(v), message(std::move(msg)) {}

    operator bool() const { return value != StoreErrc::kSuccess; }
    bool Is(StoreErrc e) const { return value == e; }
    const std::string& Message() const { return message; }

    std::string ToString() const {
        std::string s(trs::core::ToString(value));
        if (!message.empty()) { s += ": "; s += message; }
        return s;
    }
};

template<typename T>
class Result {
    std::variant<T, ErrorCode> data_;
public:
    Result(const T& v) : data_(v) {}
    Result(T&& v) : data_(std::move(v)) {}
    Result(ErrorCode e) : data_(std::move(e)) {}
    Result(StoreErrc e) : data_(ErrorCode(e)) {}

    bool HasValue() const { return std::holds_alternative<T>(data_); }
    T& Value() { return std::get<T>(data_); }
    const T& Value() const { return std::get<T>(data_); }
    const ErrorCode& Error() const { return std::get<ErrorCode>(data_); }

    explicit operator bool() const { return HasValue(); }

    T& operator*() { return Value(); }
    const T& operator*() const { return Value(); }
    T* operator->() { return &Value(); }
    const T* operator->() const { return &Value(); }
};

template<>
class Result<void> {
    bool ok_;
    ErrorCode err_;
public:
    Result() : ok_(true), err_(StoreErrc::kSuccess) {}
    Result(ErrorCode e) : ok_(false), err_(std::move(e)) {}
    Result(StoreErrc e) : ok_(false), err_(e) {}

    bool HasValue() const { return ok_; }
    void Value() const {}  // no-op
    const ErrorCode& Error() const { return err_; }

    explicit operator bool() const { return ok_; }
};

} // namespace trs::core
