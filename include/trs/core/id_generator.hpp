#pragma once
#include <atomic>
#include <cstdint>
#include <string>

namespace trs::core {

// Instance ids: base62(nanoseconds since epoch) followed by a fixed-width
// base62 sequence number. The sequence keeps ids unique when two calls land in
// the same nanosecond; each generator owns its own counter.
class IdGenerator {
public:
    static constexpr std::size_t kSequenceLength = 6;

    std::string Next();

private:
    std::atomic<uint32_t> counter_{0};
};

} // namespace trs::core
