#include <gtest/gtest.h>
#include <persistency/storage_registry.hpp>

#include <chrono>
#include <string>

#ifndef K_MANIFEST_PATH
#  define K_MANIFEST_PATH "manifests/result_store.json"
#endif

using persistency::StorageRegistry;
using trs::core::StoreErrc;
using namespace std::chrono_literals;

class StorageRegistryTest : public ::testing::Test {
protected:
  void SetUp() override { StorageRegistry::Instance().Clear(); }
  void TearDown() override { StorageRegistry::Instance().Clear(); }
  StorageRegistry& reg() { return StorageRegistry::Instance(); }
};

TEST_F(StorageRegistryTest, LoadsShippedManifest) {
  auto r = reg().InitFromFile(K_MANIFEST_PATH);
  ASSERT_TRUE(r.HasValue()) << r.Error().ToString();
  ASSERT_TRUE(reg().IsInitialized());
  EXPECT_EQ(reg().LogLevel(), trs::log::LogLevel::kInfo);

  auto results = reg().Lookup("Task/Results");
  ASSERT_TRUE(results.has_value());
  EXPECT_EQ(results->base_path, "data");
  EXPECT_EQ(results->stale_temp_threshold, 3600s);
  EXPECT_EQ(results->rename_max_retries, 5);
  EXPECT_EQ(results->rename_retry_delay, 10ms);
  EXPECT_TRUE(results->cleanup_on_start);

  auto scratch = reg().Lookup("Task/Scratch");
  ASSERT_TRUE(scratch.has_value());
  EXPECT_EQ(scratch->stale_temp_threshold, 60s);
  EXPECT_FALSE(scratch->cleanup_on_start);

  EXPECT_FALSE(reg().Lookup("Task/Unknown").has_value());
}

TEST_F(StorageRegistryTest, MissingFieldsTakeDefaults) {
  ASSERT_TRUE(reg().InitFromString(R"({"storages":[{"instance_spec":"A"}]})").HasValue());
  auto a = reg().Lookup("A");
  ASSERT_TRUE(a.has_value());
  EXPECT_TRUE(a->base_path.empty());
  EXPECT_EQ(a->stale_temp_threshold, 1h);
  EXPECT_EQ(a->rename_max_retries, 5);
  EXPECT_EQ(a->rename_retry_delay, 10ms);
  EXPECT_TRUE(a->cleanup_on_start);
  EXPECT_FALSE(reg().LogLevel().has_value());
}

TEST_F(StorageRegistryTest, MissingFileIsNotFound) {
  auto r = reg().InitFromFile("/nonexistent/manifest.json");
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, StoreErrc::kNotFound);
  EXPECT_FALSE(reg().IsInitialized());
}

TEST_F(StorageRegistryTest, MalformedManifestIsCorruption) {
  for (const char* text : {"{", "[]", R"({"storages": 3})", R"({"storages":[{"base_path":"x"}]})"}) {
    auto r = reg().InitFromString(text);
    ASSERT_FALSE(r.HasValue()) << text;
    EXPECT_EQ(r.Error().value, StoreErrc::kCorruption) << text;
  }
  EXPECT_FALSE(reg().IsInitialized());
}

TEST_F(StorageRegistryTest, InvalidValuesAreRejected) {
  for (const char* text : {
           R"({"storages":[{"instance_spec":"A","rename_max_retries":0}]})",
           R"({"storages":[{"instance_spec":"A","stale_temp_threshold_s":-1}]})",
           R"({"storages":[{"instance_spec":"A","stale_temp_threshold_s":0}]})",
           R"({"storages":[{"instance_spec":"A","rename_retry_delay_ms":-5}]})",
           R"({"storages":[{"instance_spec":"A"},{"instance_spec":"A"}]})",
           R"({"log_level":"loud","storages":[]})"}) {
    auto r = reg().InitFromString(text);
    ASSERT_FALSE(r.HasValue()) << text;
    EXPECT_EQ(r.Error().value, StoreErrc::kInvalidInput) << text;
  }
}

TEST_F(StorageRegistryTest, FailedReloadKeepsPreviousEntries) {
  ASSERT_TRUE(reg().InitFromString(R"({"storages":[{"instance_spec":"Keep","base_path":"k"}]})").HasValue());
  ASSERT_FALSE(reg().InitFromString(R"({"storages":[{"instance_spec":"New","rename_max_retries":0}]})").HasValue());

  EXPECT_TRUE(reg().Lookup("Keep").has_value());
  EXPECT_FALSE(reg().Lookup("New").has_value());
}

TEST_F(StorageRegistryTest, ClearForgetsEverything) {
  ASSERT_TRUE(reg().InitFromString(R"({"log_level":"debug","storages":[{"instance_spec":"A"}]})").HasValue());
  EXPECT_EQ(reg().LogLevel(), trs::log::LogLevel::kDebug);
  reg().Clear();
  EXPECT_FALSE(reg().IsInitialized());
  EXPECT_FALSE(reg().Lookup("A").has_value());
  EXPECT_FALSE(reg().LogLevel().has_value());
}
