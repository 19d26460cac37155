#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "sgov/core/result.hpp"
#include "sgov/foundation/common_adapter.hpp"

using namespace sgov::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::SourceUnavailable), "Governor");
    EXPECT_EQ(errorSubsystem(ErrorCode::AdmissionAbandoned), "Governor");
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x4200)), "Unknown");
}

TEST(ErrorCodeTest, GovernorCodesShareOneRange) {
    for (auto code : {ErrorCode::SourceUnavailable, ErrorCode::SourceNotConfigured,
                      ErrorCode::UpstreamFailure, ErrorCode::UpstreamThrottled,
                      ErrorCode::AdmissionAbandoned}) {
        EXPECT_EQ(static_cast<uint32_t>(code) & 0xFF00, 0x0900u);
    }
}

// --- GovernorError tests ---

TEST(GovernorErrorTest, DefaultConstruction) {
    GovernorError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(GovernorErrorTest, CodeAndMessage) {
    GovernorError err(ErrorCode::SourceUnavailable, "helius is unavailable");
    EXPECT_EQ(err.code(), ErrorCode::SourceUnavailable);
    EXPECT_EQ(err.message(), "helius is unavailable");
    EXPECT_EQ(err.subsystem(), "Governor");
    EXPECT_FALSE(err.isSuccess());
}

TEST(GovernorErrorTest, StatusCodeContext) {
    GovernorError err(ErrorCode::UpstreamThrottled, "throttled", 429);
    EXPECT_TRUE(err.hasContext());
    const int* status = err.context<int>();
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(*status, 429);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<std::string>(), nullptr);
}

TEST(GovernorErrorTest, SuccessCheck) {
    GovernorError success(ErrorCode::Success);
    EXPECT_TRUE(success.isSuccess());
}

// --- GovernorResult tests ---

TEST(GovernorResultTest, OkValue) {
    auto result = GovernorResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(GovernorResultTest, ErrorValue) {
    auto result = GovernorResult<int>::err(
        GovernorError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(GovernorResultTest, ValueOrFallsBack) {
    auto bad = GovernorResult<double>::err(GovernorError(ErrorCode::UpstreamFailure));
    EXPECT_DOUBLE_EQ(bad.valueOr(0.5), 0.5);

    auto good = GovernorResult<double>::ok(0.9);
    EXPECT_DOUBLE_EQ(good.valueOr(0.5), 0.9);
}

TEST(GovernorResultTest, MoveOnlyValue) {
    auto result = GovernorResult<std::unique_ptr<int>>::ok(std::make_unique<int>(7));
    ASSERT_TRUE(result.hasValue());
    auto owned = std::move(result).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(GovernorResultTest, VoidOk) {
    auto result = GovernorResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(GovernorResultTest, VoidError) {
    auto result = GovernorResult<void>::err(
        GovernorError(ErrorCode::SourceUnavailable, "open"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SourceUnavailable);
}

TEST(ResultTest, DefaultErrorType) {
    auto result = sgov::Result<int>::err(sgov::Error("boom"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, -1);
    EXPECT_EQ(result.error().message, "boom");
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("sgov_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("test.yaml", R"(
governor:
  breaker:
    trip_threshold: 7
  name: "primary"
)");

    ConfigManager config;
    auto loadResult = config.load(path);
    ASSERT_TRUE(loadResult.hasValue());

    auto threshold = config.get<int>("governor.breaker.trip_threshold");
    ASSERT_TRUE(threshold.hasValue());
    EXPECT_EQ(threshold.value(), 7);

    auto name = config.get<std::string>("governor.name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "primary");
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedYamlFails) {
    auto path = writeYaml("broken.yaml", "governor: [unterminated");
    ConfigManager config;
    auto result = config.load(path);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, ScalarRootRejected) {
    ConfigManager config;
    auto result = config.loadFromString("just a string");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, EmptyDocumentIsValid) {
    ConfigManager config;
    EXPECT_TRUE(config.loadFromString("").hasValue());
    EXPECT_FALSE(config.hasKey("anything"));
}

TEST_F(ConfigManagerTest, ReloadReplacesPreviousEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1\nb: 2").hasValue());
    ASSERT_TRUE(config.loadFromString("c: 3").hasValue());

    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_FALSE(config.hasKey("b"));
    EXPECT_TRUE(config.hasKey("c"));
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("governor.breaker.trip_threshold", 9);

    auto result = config.get<int>("governor.breaker.trip_threshold");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 9);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}

TEST_F(ConfigManagerTest, ChildKeysListsImmediateChildrenSorted) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
governor:
  sources:
    reddit:
      max_concurrent: 10
      window_ms: 60000
    helius:
      max_concurrent: 1
  breaker:
    trip_threshold: 5
)").hasValue());

    EXPECT_EQ(config.childKeys("governor.sources"),
              (std::vector<std::string>{"helius", "reddit"}));
    EXPECT_EQ(config.childKeys("governor"),
              (std::vector<std::string>{"breaker", "sources"}));
    EXPECT_EQ(config.childKeys(""), (std::vector<std::string>{"governor"}));
    EXPECT_TRUE(config.childKeys("governor.window").empty());
}

TEST_F(ConfigManagerTest, ChildKeysIgnoresSiblingPrefixes) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("ab:\n  x: 1\na:\n  y: 2").hasValue());

    EXPECT_EQ(config.childKeys("a"), (std::vector<std::string>{"y"}));
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    bool notified = false;
    std::string notifiedKey;

    config.watch("governor.window.safety_margin_ms", [&](std::string_view key) {
        notified = true;
        notifiedKey = std::string(key);
    });

    config.set<int>("governor.window.safety_margin_ms", 250);
    EXPECT_TRUE(notified);
    EXPECT_EQ(notifiedKey, "governor.window.safety_margin_ms");
}

TEST_F(ConfigManagerTest, WatchCallbackMayReadNewValue) {
    ConfigManager config;
    int observed = 0;

    config.watch("probe.workers_per_source", [&](std::string_view key) {
        auto value = config.get<int>(key);
        if (value) {
            observed = value.value();
        }
    });

    config.set<int>("probe.workers_per_source", 4);
    EXPECT_EQ(observed, 4);
}
