#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "vidlift/core/config.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "vidlift_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteServerConfig(const std::filesystem::path& path, const std::string& secret,
                       const std::string& part_sizes) {
    std::ofstream out(path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": 8080,\n"
        << "    \"threads\": 1,\n"
        << "    \"public_base_url\": \"http://uploads.example.local\",\n"
        << "    \"tls\": {\"enabled\": false, \"certificate\": \"\", \"private_key\": \"\"},\n"
        << "    \"limits\": {\"max_body_bytes\": 1048576}\n"
        << "  },\n"
        << "  \"storage\": {\"base_path\": \"data\", \"temp_path\": \"data/tmp\"},\n"
        << "  \"upload\": {\n"
        << "    " << part_sizes << "\n"
        << "    \"signing_secret\": \"" << secret << "\",\n"
        << "    \"destination_ttl_seconds\": 120\n"
        << "  },\n"
        << "  \"cleanup\": {\"enabled\": false},\n"
        << "  \"observability\": {\"log_level\": \"warning\"}\n"
        << "}\n";
}

void WriteClientConfig(const std::filesystem::path& path, const std::string& base_url,
                       int concurrency) {
    std::ofstream out(path);
    out << "{\n"
        << "  \"api\": {\"base_url\": \"" << base_url << "\", \"timeout_seconds\": 10},\n"
        << "  \"upload\": {\"part_size\": 1048576, \"concurrency\": " << concurrency << "},\n"
        << "  \"thumbnail\": {\"enabled\": false}\n"
        << "}\n";
}

}  // namespace

TEST(Config, LoadsServerSettings) {
    const auto path = MakeTempConfigPath();
    WriteServerConfig(path, "s3cret", "");

    auto config = vidlift::core::LoadConfig(path.string());
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.public_base_url, "http://uploads.example.local");
    EXPECT_EQ(config.server.limits.max_body_bytes, 1048576u);
    EXPECT_EQ(config.upload.signing_secret, "s3cret");
    EXPECT_EQ(config.upload.destination_ttl_seconds, 120);
    EXPECT_EQ(config.upload.default_part_size, 10u * 1024 * 1024);
    EXPECT_FALSE(config.cleanup.enabled);

    std::filesystem::remove(path);
}

TEST(Config, SigningSecretIsRequired) {
    const auto path = MakeTempConfigPath();
    WriteServerConfig(path, "  ", "");

    EXPECT_THROW({ (void)vidlift::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, DefaultPartSizeMustLieWithinBounds) {
    const auto path = MakeTempConfigPath();
    WriteServerConfig(path, "s3cret",
                      "\"min_part_size\": 1024, \"max_part_size\": 2048, "
                      "\"default_part_size\": 4096,");

    EXPECT_THROW({ (void)vidlift::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, LoadsClientSettings) {
    const auto path = MakeTempConfigPath();
    WriteClientConfig(path, "http://127.0.0.1:8080", 3);

    auto config = vidlift::core::LoadClientConfig(path.string());
    EXPECT_EQ(config.api.base_url, "http://127.0.0.1:8080");
    EXPECT_EQ(config.api.timeout_seconds, 10);
    EXPECT_EQ(config.upload.part_size, 1048576u);
    EXPECT_EQ(config.upload.concurrency, 3);
    EXPECT_EQ(config.upload.max_attempts, 3);
    EXPECT_FALSE(config.thumbnail.enabled);

    std::filesystem::remove(path);
}

TEST(Config, ClientRequiresBaseUrl) {
    const auto path = MakeTempConfigPath();
    WriteClientConfig(path, "", 3);

    EXPECT_THROW({ (void)vidlift::core::LoadClientConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, ClientRejectsNonPositiveConcurrency) {
    const auto path = MakeTempConfigPath();
    WriteClientConfig(path, "http://127.0.0.1:8080", 0);

    EXPECT_THROW({ (void)vidlift::core::LoadClientConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}
