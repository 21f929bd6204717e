#include <trs/core/id_generator.hpp>
#include <chrono>

namespace {

constexpr char kBase62[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr uint64_t kBase = 62;

void AppendBase62(std::string& dst, uint64_t num) {
    if (num == 0) {
        dst.push_back(kBase62[0]);
        return;
    }
    char tmp[16];
    int idx = sizeof(tmp);
    while (num > 0) {
        tmp[--idx] = kBase62[num % kBase];
        num /= kBase;
    }
    dst.append(tmp + idx, sizeof(tmp) - idx);
}

// Left-padded with '0' to width; only the low digits are kept on overflow.
void AppendBase62Fixed(std::string& dst, uint64_t num, std::size_t width) {
    std::string digits(width, kBase62[0]);
    for (std::size_t i = width; i > 0 && num > 0; --i) {
        digits[i - 1] = kBase62[num % kBase];
        num /= kBase;
    }
    dst += digits;
}

} // namespace

namespace trs::core {

std::string IdGenerator::Next() {
    using namespace std::chrono;
    const auto now = duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
    const uint32_t seq = counter_.fetch_add(1, std::memory_order_relaxed) + 1;

    std::string id;
    id.reserve(18);
    AppendBase62(id, now < 0 ? static_cast<uint64_t>(-now) : static_cast<uint64_t>(now));
    AppendBase62Fixed(id, seq, kSequenceLength);
    return id;
}

} // namespace trs::core
