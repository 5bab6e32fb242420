#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkshare/core/config.h"

namespace {

std::filesystem::path MakeTempConfigPath() {
    const auto name = "chunkshare_cfg_" + Poco::UUIDGenerator().createOne().toString() + ".json";
    return std::filesystem::temp_directory_path() / name;
}

void WriteFile(const std::filesystem::path& path, const std::string& body) {
    std::ofstream out(path);
    out << body;
}

std::string ConfigWith(const std::string& secret, const std::string& uploads = "") {
    return std::string("{\n") +
           "  \"server\": {\"host\": \"127.0.0.1\", \"port\": 9090, \"threads\": 2},\n" +
           "  \"storage\": {\"root\": \"/var/lib/chunkshare\"},\n" +
           (uploads.empty() ? "" : "  \"uploads\": " + uploads + ",\n") +
           "  \"auth\": {\"token_secret\": \"" + secret + "\"}\n" + "}\n";
}

}  // namespace

TEST(Config, AppliesDefaultsForOmittedKeys) {
    const auto path = MakeTempConfigPath();
    WriteFile(path, ConfigWith("0123456789abcdef0123"));

    auto config = chunkshare::core::LoadConfig(path.string());
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.threads, 2);
    EXPECT_EQ(config.storage.tmp_dir, "/var/lib/chunkshare/uploads/tmp");
    EXPECT_EQ(config.storage.files_dir, "/var/lib/chunkshare/files");
    EXPECT_EQ(config.uploads.max_chunk_size, 16ULL * 1024 * 1024);
    EXPECT_EQ(config.uploads.default_chunk_size, 8ULL * 1024 * 1024);
    EXPECT_EQ(config.links.default_expiry_minutes, 60);
    EXPECT_EQ(config.links.max_lifetime_seconds, 0);
    EXPECT_TRUE(config.cleanup.enabled);
    EXPECT_EQ(config.observability.log_level, "information");

    std::filesystem::remove(path);
}

TEST(Config, RejectsShortTokenSecret) {
    const auto path = MakeTempConfigPath();
    WriteFile(path, ConfigWith("short"));

    EXPECT_THROW({ (void)chunkshare::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, RejectsDefaultChunkLargerThanMaximum) {
    const auto path = MakeTempConfigPath();
    WriteFile(path, ConfigWith("0123456789abcdef0123",
                               R"({"max_chunk_size": 1024, "default_chunk_size": 2048})"));

    EXPECT_THROW({ (void)chunkshare::core::LoadConfig(path.string()); }, std::invalid_argument);

    std::filesystem::remove(path);
}

TEST(Config, ValidateRejectsBodyLimitBelowChunkSize) {
    chunkshare::core::Config config;
    config.auth.token_secret = "0123456789abcdef0123";
    EXPECT_NO_THROW(chunkshare::core::ValidateConfig(config));

    config.server.limits.max_body_bytes = config.uploads.max_chunk_size - 1;
    EXPECT_THROW(chunkshare::core::ValidateConfig(config), std::invalid_argument);
}

TEST(Config, LoadsDatabasePath) {
    const auto path = MakeTempConfigPath();
    WriteFile(path, R"({"sqlite": {"path": "/tmp/meta.db"}})");
    EXPECT_EQ(chunkshare::core::LoadDatabasePath(path.string()), "/tmp/meta.db");

    WriteFile(path, "{}");
    EXPECT_EQ(chunkshare::core::LoadDatabasePath(path.string()), "data/metadata.db");

    std::filesystem::remove(path);
}
