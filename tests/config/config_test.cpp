#include "dcp/config/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using dcp::config::Config;
using dcp::config::load_config;
using dcp::config::parse_config;
using dcp::config::parse_log_level;
using dcp::config::parse_size;
using dcp::copy::ChecksumMode;
using dcp::copy::FileAttribute;
using json = nlohmann::json;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("dcp_config_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

} // namespace

TEST(ParseSize, AcceptsPlainNumbersAndBinaryUnits) {
    EXPECT_EQ(parse_size("1024"), 1024u);
    EXPECT_EQ(parse_size("0"), 0u);
    EXPECT_EQ(parse_size("512K"), 512u * 1024);
    EXPECT_EQ(parse_size("10MB"), 10u * 1024 * 1024);
    EXPECT_EQ(parse_size("2 GiB"), 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(parse_size(" 7b"), 7u);
}

TEST(ParseSize, RejectsGarbageAndOverflow) {
    EXPECT_FALSE(parse_size(""));
    EXPECT_FALSE(parse_size("MB"));
    EXPECT_FALSE(parse_size("12XB"));
    EXPECT_FALSE(parse_size("-5"));
    EXPECT_FALSE(parse_size("1.5M"));
    EXPECT_FALSE(parse_size("99999999999999999999"));
    EXPECT_FALSE(parse_size("17000000TB"));
}

TEST(ParseLogLevel, KnownNames) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("WARNING"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_FALSE(parse_log_level("verbose"));
}

TEST(ParseConfig, EmptyObjectGivesDefaults) {
    auto parsed = parse_config(json::object());

    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const Config& config = parsed.value();
    EXPECT_EQ(config.copy.max_bytes_per_sec, dcp::copy::CopyOptions::kDefaultBandwidth);
    EXPECT_EQ(config.copy.buffer_size, dcp::copy::CopyOptions::kDefaultBufferSize);
    EXPECT_EQ(config.copy.checksum_mode, ChecksumMode::Verify);
    EXPECT_TRUE(config.copy.work_path.empty());
    EXPECT_TRUE(config.preserve.empty());
    EXPECT_FALSE(config.skip_read_failures);
    EXPECT_EQ(config.retry.max_attempts, 3u);
    EXPECT_EQ(config.log_level, spdlog::level::info);
}

TEST(ParseConfig, ReadsEveryField) {
    const auto document = json::parse(R"({
        "bandwidth": "10MB",
        "work_path": "/data/.staging",
        "buffer_size": 65536,
        "checksum": "skip",
        "preserve": "rb",
        "skip_read_failures": true,
        "log_level": "debug",
        "retry": {
            "max_attempts": 5,
            "initial_delay_ms": 50,
            "backoff_multiplier": 3.0,
            "max_delay_ms": 2000
        }
    })");

    auto parsed = parse_config(document);

    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const Config& config = parsed.value();
    EXPECT_EQ(config.copy.max_bytes_per_sec, 10 * 1024 * 1024);
    EXPECT_EQ(config.copy.work_path, fs::path("/data/.staging"));
    EXPECT_EQ(config.copy.buffer_size, 65536u);
    EXPECT_EQ(config.copy.checksum_mode, ChecksumMode::Skip);
    EXPECT_TRUE(config.preserve.contains(FileAttribute::Replication));
    EXPECT_TRUE(config.preserve.contains(FileAttribute::BlockSize));
    EXPECT_TRUE(config.skip_read_failures);
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_EQ(config.retry.max_attempts, 5u);
    EXPECT_EQ(config.retry.initial_delay.count(), 50);
    EXPECT_DOUBLE_EQ(config.retry.backoff_multiplier, 3.0);
    EXPECT_EQ(config.retry.max_delay.count(), 2000);
}

TEST(ParseConfig, ZeroBandwidthMeansUnlimited) {
    auto parsed = parse_config(json{{"bandwidth", 0}});

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().copy.max_bytes_per_sec, 0);
}

TEST(ParseConfig, RejectsSizesBeyondSignedRange) {
    EXPECT_TRUE(parse_config(json{{"bandwidth", "9000000000G"}}).is_error());
    EXPECT_TRUE(parse_config(json{{"bandwidth", 18446744073709551615ULL}}).is_error());
    EXPECT_TRUE(parse_config(json{{"buffer_size", "16000000TB"}}).is_error());

    auto largest = parse_config(json{{"bandwidth", "8388607T"}});
    ASSERT_TRUE(largest.is_ok()) << largest.error();
    EXPECT_GT(largest.value().copy.max_bytes_per_sec, 0);
}

TEST(ParseConfig, RejectsInvalidValues) {
    EXPECT_TRUE(parse_config(json::array()).is_error());
    EXPECT_TRUE(parse_config(json{{"bandwidth", "fast"}}).is_error());
    EXPECT_TRUE(parse_config(json{{"buffer_size", 0}}).is_error());
    EXPECT_TRUE(parse_config(json{{"checksum", "sometimes"}}).is_error());
    EXPECT_TRUE(parse_config(json{{"preserve", "rx"}}).is_error());
    EXPECT_TRUE(parse_config(json{{"log_level", "loud"}}).is_error());
    EXPECT_TRUE(parse_config(json{{"skip_read_failures", "yes"}}).is_error());
    EXPECT_TRUE(parse_config(json{{"retry", json{{"max_attempts", 0}}}}).is_error());
    EXPECT_TRUE(parse_config(json{{"retry", json{{"backoff_multiplier", 0.5}}}}).is_error());
    EXPECT_TRUE(parse_config(json{{"retry", 3}}).is_error());
}

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path write(const std::string& name, const std::string& content) {
        const auto path = root_ / name;
        std::ofstream output(path);
        output << content;
        return path;
    }

    fs::path root_;
};

TEST_F(LoadConfigTest, LoadsFile) {
    const auto path = write("dcp.json", R"({"bandwidth": "1M", "preserve": "b"})");

    auto loaded = load_config(path);

    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    EXPECT_EQ(loaded.value().copy.max_bytes_per_sec, 1024 * 1024);
    EXPECT_TRUE(loaded.value().preserve.contains(FileAttribute::BlockSize));
    EXPECT_FALSE(loaded.value().preserve.contains(FileAttribute::Replication));
}

TEST_F(LoadConfigTest, ReportsMissingAndMalformedFiles) {
    EXPECT_TRUE(load_config(root_ / "absent.json").is_error());

    const auto path = write("broken.json", "{ not json");
    auto loaded = load_config(path);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_NE(loaded.error().find("Malformed"), std::string::npos);
}
