#include <persistency/record_filename.hpp>
#include <cinttypes>
#include <cstdio>

namespace {

inline bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
inline bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::string_view trim_space(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

inline bool is_reserved(char c) {
    switch (c) {
        case '/': case '\\': case '|': case '<': case '>':
        case ':': case '"':  case '?': case '*':
            return true;
        default:
            return false;
    }
}

// Length of the UTF-8 sequence starting at s[i]; 1 for a malformed byte
std::size_t utf8_seq_len(std::string_view s, std::size_t i) {
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t n = 1;
    if      (lead >= 0xC2 && lead <= 0xDF) n = 2;
    else if (lead >= 0xE0 && lead <= 0xEF) n = 3;
    else if (lead >= 0xF0 && lead <= 0xF4) n = 4;
    if (i + n > s.size()) return 1;
    for (std::size_t k = 1; k < n; ++k) {
        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 1;
    }
    return n;
}

} // namespace

namespace persistency {

std::string ToKebabCase(std::string_view in) {
    const std::string_view s = trim_space(in);
    std::string out;
    out.reserve(s.size() + 2);

    for (std::size_t i = 0; i < s.size(); ++i) {
        char v = s[i];
        const bool v_cap = is_upper(v);
        const bool v_low = is_lower(v);
        if (v_cap) v = static_cast<char>(v - 'A' + 'a');

        if (i + 1 < s.size()) {
            const char next = s[i + 1];
            const bool v_num = is_digit(v);
            const bool next_cap = is_upper(next);
            const bool next_low = is_lower(next);
            const bool next_num = is_digit(next);

            // word boundary on a case or letter/digit change
            if ((v_cap && (next_low || next_num)) ||
                (v_low && (next_cap || next_num)) ||
                (v_num && (next_cap || next_low))) {
                // "JSONData": the last capital of an acronym starts the next word
                if (v_cap && next_low && i > 0 && is_upper(s[i - 1])) {
                    out.push_back('-');
                }
                out.push_back(v);
                if (v_low || v_num || next_num) {
                    out.push_back('-');
                }
                continue;
            }
        }

        if (v == ' ' || v == '_' || v == '-' || v == '.') {
            out.push_back('-');
        } else {
            out.push_back(v);
        }
    }
    return out;
}

std::string SanitizeName(std::string_view s) {
    std::string kebab = ToKebabCase(s);
    for (char& c : kebab) {
        const auto b = static_cast<unsigned char>(c);
        if (b < 0x20 || b == 0x7F) c = '-';
    }

    std::string out;
    out.reserve(kebab.size());
    for (std::size_t i = 0; i < kebab.size(); ++i) {
        if (kebab[i] == '.' && i + 1 < kebab.size() && kebab[i + 1] == '.') {
            out += "--";
            ++i;
        } else if (is_reserved(kebab[i])) {
            out.push_back('-');
        } else {
            out.push_back(kebab[i]);
        }
    }
    return out;
}

std::string TruncateUtf8(std::string_view s, std::size_t limit) {
    if (s.size() <= limit) return std::string(s);

    std::size_t total = 0;
    while (total < s.size()) {
        const std::size_t n = utf8_seq_len(s, total);
        if (total + n > limit) break;
        total += n;
    }
    return std::string(s.substr(0, total));
}

uint64_t Fnv1a64(std::string_view data, uint64_t seed) {
    constexpr uint64_t kPrime = 0x100000001b3ull;
    uint64_t h = seed;
    for (char c : data) {
        h ^= static_cast<unsigned char>(c);
        h *= kPrime;
    }
    return h;
}

uint64_t HashKeyParts(std::string_view part1, std::string_view part2) {
    std::string encoded;
    encoded.reserve(part1.size() + part2.size() + 24);
    encoded += std::to_string(part1.size());
    encoded += ':';
    encoded += part1;
    encoded += '|';
    encoded += std::to_string(part2.size());
    encoded += ':';
    encoded += part2;
    return Fnv1a64(encoded);
}

std::string MakeRecordFilename(std::string_view part1, std::string_view part2,
                               std::string_view prefix, std::string_view extension) {
    const std::string name1 = TruncateUtf8(SanitizeName(part1), kMaxNamePartBytes);
    const std::string name2 = TruncateUtf8(SanitizeName(part2), kMaxNamePartBytes);

    char hash[17];
    std::snprintf(hash, sizeof(hash), "%016" PRIx64, HashKeyParts(part1, part2));

    std::string out;
    out.reserve(prefix.size() + name1.size() + name2.size() + extension.size() + 20);
    out += prefix;
    out += '-';
    out += name1;
    out += '-';
    out += name2;
    out += '-';
    out += hash;
    out += '.';
    out += extension;
    return out;
}

bool IsTempFileName(std::string_view filename) {
    return filename.size() >= kTempFilePrefix.size() + kTempFileSuffix.size() &&
           filename.substr(0, kTempFilePrefix.size()) == kTempFilePrefix &&
           filename.substr(filename.size() - kTempFileSuffix.size()) == kTempFileSuffix;
}

} // namespace persistency
