#include <gtest/gtest.h>
#include <persistency/record_filename.hpp>

#include <regex>
#include <string>

using namespace persistency;

TEST(RecordFilename, KebabCaseSplitsWordsAndLowercases) {
    EXPECT_EQ(ToKebabCase("MyTask"), "my-task");
    EXPECT_EQ(ToKebabCase("JSONData"), "json-data");
    EXPECT_EQ(ToKebabCase("WatchPrice_Any"), "watch-price-any");
    EXPECT_EQ(ToKebabCase("abc123def"), "abc-123-def");
    EXPECT_EQ(ToKebabCase("  Hello World  "), "hello-world");
    EXPECT_EQ(ToKebabCase(""), "");
}

TEST(RecordFilename, UnderscoreHyphenAndCaseCollapseToSameReadableName) {
    EXPECT_EQ(SanitizeName("Task_A"), "task-a");
    EXPECT_EQ(SanitizeName("Task-A"), "task-a");
    EXPECT_EQ(SanitizeName("task_a"), "task-a");
}

TEST(RecordFilename, SanitizeReplacesPathAndReservedCharacters) {
    EXPECT_EQ(SanitizeName("../../secret"), "------secret");
    EXPECT_EQ(SanitizeName("a\\b"), "a-b");
    EXPECT_EQ(SanitizeName("a<b>c:d\"e|f?g*h"), "a-b-c-d-e-f-g-h");

    const std::string hostile = SanitizeName("..\\..//etc/passwd");
    EXPECT_EQ(hostile.find('/'), std::string::npos);
    EXPECT_EQ(hostile.find('\\'), std::string::npos);
    EXPECT_EQ(hostile.find(".."), std::string::npos);
}

TEST(RecordFilename, SanitizeStripsControlCharacters) {
    const std::string in{"a\x01" "b\x1f" "c\x7f" "d"};
    EXPECT_EQ(SanitizeName(in), "a-b-c-d");

    const std::string with_nul("x\0y", 3);
    EXPECT_EQ(SanitizeName(with_nul), "x-y");
}

TEST(RecordFilename, NonAsciiBytesPassThrough) {
    EXPECT_EQ(SanitizeName("가격"), "가격");
}

TEST(RecordFilename, TruncateKeepsWholeUtf8Characters) {
    EXPECT_EQ(TruncateUtf8("short", 50), "short");
    EXPECT_EQ(TruncateUtf8(std::string(60, 'a'), 50), std::string(50, 'a'));

    // 3-byte characters: 16 fit in 50 bytes (48), the 17th would split
    std::string hangul;
    for (int i = 0; i < 20; ++i) hangul += "가";
    const std::string cut = TruncateUtf8(hangul, 50);
    EXPECT_EQ(cut.size(), 48u);
    EXPECT_EQ(cut, hangul.substr(0, 48));

    // 4-byte emoji after 48 ASCII bytes does not fit in the remaining 2
    const std::string mixed = std::string(48, 'x') + "\xF0\x9F\x98\x80" + "tail";
    EXPECT_EQ(TruncateUtf8(mixed, 50), std::string(48, 'x'));
}

TEST(RecordFilename, TruncateCountsMalformedBytesSingly) {
    const std::string bad = std::string(49, 'a') + "\xE0\x80";   // truncated sequence
    EXPECT_EQ(TruncateUtf8(bad, 50), std::string(49, 'a') + "\xE0");
}

TEST(RecordFilename, FnvMatchesReferenceVectors) {
    EXPECT_EQ(Fnv1a64(""), 0xcbf29ce484222325ull);
    EXPECT_EQ(Fnv1a64("a"), 0xaf63dc4c8601ec8cull);
}

TEST(RecordFilename, LengthPrefixSeparatesShiftedSplits) {
    EXPECT_NE(HashKeyParts("ab", "c"), HashKeyParts("a", "bc"));
    EXPECT_EQ(HashKeyParts("ab", "c"), 0xd3a2835d61e7c716ull);
    EXPECT_EQ(HashKeyParts("a", "bc"), 0x893a2fb260d07cf4ull);
}

TEST(RecordFilename, FilenameLayout) {
    EXPECT_EQ(MakeRecordFilename("MyTask", "Run"), "task-my-task-run-6d8ce5510f315f80.json");
    EXPECT_EQ(MakeRecordFilename("MyTask", "Run", "job", "bin"), "job-my-task-run-6d8ce5510f315f80.bin");

    const std::regex layout(R"(^task-[^/\\]*-[^/\\]*-[0-9a-f]{16}\.json$)");
    EXPECT_TRUE(std::regex_match(MakeRecordFilename("../../secret", "x/y"), layout));
    EXPECT_TRUE(std::regex_match(MakeRecordFilename("", ""), layout));
}

TEST(RecordFilename, SameReadableNameDifferentHash) {
    const std::string a = MakeRecordFilename("Task_A", "cmd");
    const std::string b = MakeRecordFilename("Task-A", "cmd");
    EXPECT_EQ(a, "task-task-a-cmd-94b2387d8175dcd7.json");
    EXPECT_EQ(b, "task-task-a-cmd-d52009110acd90f1.json");
    EXPECT_NE(a, b);
}

TEST(RecordFilename, LongPartsAreCappedButStayDistinct) {
    const std::string base(200, 'q');
    const std::string a = MakeRecordFilename(base + "1", "cmd");
    const std::string b = MakeRecordFilename(base + "2", "cmd");
    EXPECT_NE(a, b);
    // "task-" + 50 + "-cmd-" + 16 + ".json"
    EXPECT_EQ(a.size(), 5u + 50u + 5u + 16u + 5u);
}

TEST(RecordFilename, TempFilePattern) {
    EXPECT_TRUE(IsTempFileName("task-result-abc123.tmp"));
    EXPECT_TRUE(IsTempFileName("task-result-.tmp"));
    EXPECT_FALSE(IsTempFileName("task-result-abc123.json"));
    EXPECT_FALSE(IsTempFileName("other-abc.tmp"));
    EXPECT_FALSE(IsTempFileName("task-result.tmp"));
    EXPECT_FALSE(IsTempFileName(MakeRecordFilename("result", "x")));
}
