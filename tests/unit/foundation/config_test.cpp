#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "es/ecs/entity_manager.hpp"
#include "es/foundation/config_manager.hpp"
#include "es/foundation/runtime_config.hpp"

using namespace es::foundation;

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("es_test_") + info->name();
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
ecs:
  initial_capacity: 512
simulation:
  name: "asteroids"
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto capacity = config.get<int>("ecs.initial_capacity");
    ASSERT_TRUE(capacity.hasValue());
    EXPECT_EQ(capacity.value(), 512);

    auto name = config.get<std::string>("simulation.name");
    ASSERT_TRUE(name.hasValue());
    EXPECT_EQ(name.value(), "asteroids");
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
    EXPECT_EQ(result.error().subsystem(), "Config");
}

TEST_F(ConfigManagerTest, MalformedDocument) {
    ConfigManager config;
    auto result = config.loadFromString("ecs: [unclosed");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, NonScalarKeyRejectedAndEntriesKept) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1").hasValue());

    auto result = config.loadFromString("b: 2\n? [x, y]\n: 3\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);

    // The failed document leaves the previous configuration untouched.
    EXPECT_TRUE(config.hasKey("a"));
    EXPECT_FALSE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, FailedFileLoadKeepsEntries) {
    auto path = writeYaml("complex_key.yaml", "? {k: v}\n: 1\n");
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1").hasValue());

    auto result = config.load(path);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
    EXPECT_TRUE(config.hasKey("a"));
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1\nb: 2").hasValue());
    ASSERT_TRUE(config.loadFromString("c: 3").hasValue());

    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("c"));
    auto keys = config.keys();
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], "c");
}

TEST_F(ConfigManagerTest, SetAndGet) {
    ConfigManager config;
    config.set<int>("ecs.initial_capacity", 9090);

    auto result = config.get<int>("ecs.initial_capacity");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 9090);
}

TEST_F(ConfigManagerTest, WatchNotification) {
    ConfigManager config;
    int notified = 0;
    std::string notifiedKey;

    config.watch("logging.entity", [&](std::string_view key) {
        ++notified;
        notifiedKey = std::string(key);
    });

    config.set<std::string>("logging.entity", "debug");
    config.set<std::string>("logging.system", "debug");
    EXPECT_EQ(notified, 1);
    EXPECT_EQ(notifiedKey, "logging.entity");
}

// --- RuntimeConfig tests ---

TEST(RuntimeConfigTest, DefaultsWhenKeysMissing) {
    ConfigManager config;
    auto cfg = loadRuntimeConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_EQ(cfg.value().initialCapacity, 0u);
    for (auto level : cfg.value().categoryLevels) {
        EXPECT_EQ(level, LogLevel::Info);
    }
}

TEST(RuntimeConfigTest, ReadsCapacityAndLevels) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
ecs:
  initial_capacity: 4096
logging:
  entity: debug
  system: WARN
  event: off
)").hasValue());

    auto cfg = loadRuntimeConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    const auto& levels = cfg.value().categoryLevels;
    EXPECT_EQ(cfg.value().initialCapacity, 4096u);
    EXPECT_EQ(levels[static_cast<std::size_t>(LogCategory::Entity)], LogLevel::Debug);
    EXPECT_EQ(levels[static_cast<std::size_t>(LogCategory::System)], LogLevel::Warning);
    EXPECT_EQ(levels[static_cast<std::size_t>(LogCategory::Event)], LogLevel::Off);
    EXPECT_EQ(levels[static_cast<std::size_t>(LogCategory::Core)], LogLevel::Info);
}

TEST(RuntimeConfigTest, NegativeCapacityRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("ecs:\n  initial_capacity: -5").hasValue());
    auto cfg = loadRuntimeConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(RuntimeConfigTest, CapacityBeyondIndexSpaceRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("ecs:\n  initial_capacity: 4611686018427387904").hasValue());
    auto cfg = loadRuntimeConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(RuntimeConfigTest, CapacityAtIndexSpaceLimitAccepted) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("ecs:\n  initial_capacity: 4294967295").hasValue());
    auto cfg = loadRuntimeConfig(config);
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_EQ(cfg.value().initialCapacity, kMaxInitialCapacity);
}

TEST(RuntimeConfigTest, NonNumericCapacityRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("ecs:\n  initial_capacity: lots").hasValue());
    auto cfg = loadRuntimeConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(RuntimeConfigTest, UnknownLevelRejected) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("logging:\n  query: verbose").hasValue());
    auto cfg = loadRuntimeConfig(config);
    ASSERT_TRUE(cfg.hasError());
    EXPECT_EQ(cfg.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(RuntimeConfigTest, ApplyLogLevels) {
    RuntimeConfig cfg;
    cfg.categoryLevels[static_cast<std::size_t>(LogCategory::Storage)] = LogLevel::Error;

    EcsLogger logger;
    applyLogLevels(cfg, logger);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Storage), LogLevel::Error);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Entity), LogLevel::Info);
}

TEST(RuntimeConfigTest, ManagerBuiltFromConfig) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("ecs:\n  initial_capacity: 64").hasValue());
    auto cfg = loadRuntimeConfig(config);
    ASSERT_TRUE(cfg.hasValue());

    struct Tag {};
    es::ecs::EntityManager<Tag> world(cfg.value());
    auto e = world.CreateEntity();
    EXPECT_TRUE(world.AddComponent<Tag>(e).hasValue());
}
