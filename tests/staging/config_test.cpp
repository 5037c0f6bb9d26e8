#include "stager/staging/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using stager::ErrorKind;
using stager::staging::StagingConfig;
using stager::staging::build_create_options;
using stager::staging::build_default_entries;
using stager::staging::kMaxUploadBufferSizeBytes;
using stager::staging::load_config;
using stager::staging::parse_config;

namespace {

StagingConfig base_config() {
    StagingConfig config;
    config.staging_location = "gs://bucket/staging";
    return config;
}

} // namespace

TEST(CreateOptionsTest, DefaultsToOneMebibyte) {
    auto options = build_create_options(base_config());
    ASSERT_TRUE(options.is_ok());
    EXPECT_EQ(options.value().upload_buffer_size_bytes, 1024u * 1024u);
    EXPECT_EQ(options.value().content_type, "application/octet-stream");
}

TEST(CreateOptionsTest, ClampsOversizedBuffer) {
    auto config = base_config();
    config.upload_buffer_size_bytes = 5 * 1024 * 1024;

    auto options = build_create_options(config);
    ASSERT_TRUE(options.is_ok());
    EXPECT_EQ(options.value().upload_buffer_size_bytes, kMaxUploadBufferSizeBytes);
}

TEST(CreateOptionsTest, KeepsSmallerBuffer) {
    auto config = base_config();
    config.upload_buffer_size_bytes = 4096;

    auto options = build_create_options(config);
    ASSERT_TRUE(options.is_ok());
    EXPECT_EQ(options.value().upload_buffer_size_bytes, 4096u);
}

TEST(CreateOptionsTest, RejectsNonPositiveBuffer) {
    auto config = base_config();
    config.upload_buffer_size_bytes = 0;
    auto zero = build_create_options(config);
    ASSERT_TRUE(zero.is_error());
    EXPECT_EQ(zero.error().kind, ErrorKind::InvalidConfiguration);

    config.upload_buffer_size_bytes = -1;
    auto negative = build_create_options(config);
    ASSERT_TRUE(negative.is_error());
    EXPECT_EQ(negative.error().kind, ErrorKind::InvalidConfiguration);
}

TEST(DefaultEntriesTest, PriorityArtifactLeadsAndAuxiliaryTrails) {
    auto config = base_config();
    config.files_to_stage = {"a.jar", "lib/b.jar"};
    config.priority_artifact_path = "/opt/worker.jar";
    config.auxiliary_binary_path = "/opt/windmill";

    const auto entries = build_default_entries(config);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0], "dataflow-worker.jar=/opt/worker.jar");
    EXPECT_EQ(entries[1], "a.jar");
    EXPECT_EQ(entries[2], "lib/b.jar");
    EXPECT_EQ(entries[3], "windmill_main=/opt/windmill");

    // Caller's list is left untouched
    EXPECT_EQ(config.files_to_stage.size(), 2u);
}

TEST(DefaultEntriesTest, EmptyPriorityPathIsIgnored) {
    auto config = base_config();
    config.files_to_stage = {"a.jar"};
    config.priority_artifact_path = "";

    const auto entries = build_default_entries(config);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], "a.jar");
}

TEST(ConfigParseTest, ReadsAllFields) {
    auto config = parse_config(R"({
        "staging_location": "/srv/staging",
        "upload_buffer_size_bytes": 65536,
        "priority_artifact_path": "/opt/worker.jar",
        "auxiliary_binary_path": null,
        "files_to_stage": ["a.jar", "deps=lib/b.jar"],
        "parallelism": 4
    })");

    ASSERT_TRUE(config.is_ok());
    const auto& value = config.value();
    EXPECT_EQ(value.staging_location, "/srv/staging");
    ASSERT_TRUE(value.upload_buffer_size_bytes.has_value());
    EXPECT_EQ(*value.upload_buffer_size_bytes, 65536);
    ASSERT_TRUE(value.priority_artifact_path.has_value());
    EXPECT_EQ(*value.priority_artifact_path, "/opt/worker.jar");
    EXPECT_FALSE(value.auxiliary_binary_path.has_value());
    EXPECT_EQ(value.files_to_stage, (std::vector<std::string>{"a.jar", "deps=lib/b.jar"}));
    EXPECT_EQ(value.parallelism, 4u);
}

TEST(ConfigParseTest, AppliesDefaults) {
    auto config = parse_config(R"({"staging_location": "/srv/staging"})");
    ASSERT_TRUE(config.is_ok());
    EXPECT_FALSE(config.value().upload_buffer_size_bytes.has_value());
    EXPECT_TRUE(config.value().files_to_stage.empty());
    EXPECT_EQ(config.value().parallelism, StagingConfig::kDefaultParallelism);
}

TEST(ConfigParseTest, RejectsInvalidDocuments) {
    EXPECT_EQ(parse_config("{not json").error().kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parse_config("[]").error().kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parse_config(R"({"files_to_stage": []})").error().kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parse_config(R"({"staging_location": ""})").error().kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parse_config(R"({"staging_location": 3})").error().kind, ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parse_config(R"({"staging_location": "/s", "parallelism": 0})").error().kind,
              ErrorKind::InvalidConfiguration);
    EXPECT_EQ(parse_config(R"({"staging_location": "/s", "parallelism": -2})").error().kind,
              ErrorKind::InvalidConfiguration);
}

TEST(ConfigLoadTest, ReadsFileFromDisk) {
    static std::atomic<uint64_t> counter{0};
    const fs::path path = fs::temp_directory_path() /
        ("stager_config_test_" + std::to_string(counter.fetch_add(1)) + ".json");
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"staging_location": "file:///tmp/staging", "files_to_stage": ["x.jar"]})";
    }

    auto config = load_config(path);
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().staging_location, "file:///tmp/staging");
    EXPECT_EQ(config.value().files_to_stage.size(), 1u);

    auto missing = load_config(path.string() + ".missing");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::InvalidConfiguration);
}
