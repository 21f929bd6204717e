#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace persistency {

inline constexpr std::size_t kMaxNamePartBytes = 50;
inline constexpr std::string_view kTempFilePrefix = "task-result-";
inline constexpr std::string_view kTempFileSuffix = ".tmp";

// Lowercase, hyphen-delimited form: "MyTask" -> "my-task", "JSONData" -> "json-data".
// Bytes outside ASCII are copied unchanged.
std::string ToKebabCase(std::string_view s);

// Kebab-case plus replacement of control characters, "..", path separators and
// the characters reserved on Windows (< > : " | ? *) with '-'.
std::string SanitizeName(std::string_view s);

// Cuts s to at most limit bytes without splitting a UTF-8 sequence.
std::string TruncateUtf8(std::string_view s, std::size_t limit);

// 64-bit FNV-1a
uint64_t Fnv1a64(std::string_view data, uint64_t seed = 0xcbf29ce484222325ull);

// FNV-1a over "{len(part1)}:{part1}|{len(part2)}:{part2}". The length prefixes
// keep ("ab","c") and ("a","bc") apart.
uint64_t HashKeyParts(std::string_view part1, std::string_view part2);

// "<prefix>-<sanitized part1>-<sanitized part2>-<16 hex digits>.<extension>"
std::string MakeRecordFilename(std::string_view part1, std::string_view part2,
                               std::string_view prefix = "task",
                               std::string_view extension = "json");

// Matches the "task-result-*.tmp" names produced while saving
bool IsTempFileName(std::string_view filename);

} // namespace persistency
