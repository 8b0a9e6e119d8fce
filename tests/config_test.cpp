#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "app/ConfigLoader.hpp"
#include "app/FulfillmentConfig.h"

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("fulfillment_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string Write(const std::string& yaml) {
        const fs::path file = dir_ / "config.yaml";
        std::ofstream out(file);
        out << yaml;
        return file.string();
    }

    fs::path dir_;
};

TEST_F(ConfigTest, MissingSectionsFallBackToDefaults) {
    const auto options = FulfillmentServerOptions::FromConfig(Write("serviceName: Warehouse\n"));

    EXPECT_EQ(options.serviceName, "Warehouse");
    EXPECT_EQ(options.storage.backend, "memory");
    EXPECT_EQ(options.fulfillment.lowStockThreshold, 10);
    EXPECT_EQ(options.fulfillment.lockTtlSeconds, 30);
    EXPECT_EQ(options.redis.keyPrefix, "fulfillment:");
    EXPECT_FALSE(options.mq.enabled());
}

TEST_F(ConfigTest, NestedValuesAreRead) {
    const auto options = FulfillmentServerOptions::FromConfig(Write(R"(
storage:
  backend: mysql
database:
  connInfo:
    url: tcp://db:3306
    user: ff
    password: secret
    database: fulfillment
  poolSize: 8
redis:
  host: cache
  enableLock: true
mq:
  url: amqp://guest:guest@mq:5672/
  enableConsumer: true
fulfillment:
  lowStockThreshold: 3
  lockTtlSeconds: 15
)"));

    EXPECT_TRUE(options.storage.useMySQL());
    EXPECT_EQ(options.database.connInfo.url, "tcp://db:3306");
    EXPECT_EQ(options.database.poolSize, 8);
    EXPECT_EQ(options.redis.host, "cache");
    EXPECT_TRUE(options.redis.enabled());
    EXPECT_TRUE(options.mq.enableConsumer);
    EXPECT_EQ(options.mq.commandQueue, "fulfillment.commands");
    EXPECT_EQ(options.fulfillment.lowStockThreshold, 3);
    EXPECT_EQ(options.fulfillment.lockTtlSeconds, 15);
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(FulfillmentServerOptions::FromConfig(Write("storage:\n  backend: postgres\n")), std::runtime_error);
    EXPECT_THROW(FulfillmentServerOptions::FromConfig(Write("fulfillment:\n  lockTtlSeconds: 0\n")), std::runtime_error);
    EXPECT_THROW(FulfillmentServerOptions::FromConfig(Write("mq:\n  enablePublisher: true\n  url: \"\"\n")), std::runtime_error);
}

TEST_F(ConfigTest, MissingOrBrokenFileThrows) {
    EXPECT_THROW(FulfillmentServerOptions::FromConfig((dir_ / "absent.yaml").string()), std::runtime_error);
    EXPECT_THROW(ConfigLoader loader(Write("storage: [unclosed\n")), std::runtime_error);
}

TEST_F(ConfigTest, LoaderReturnsDefaultsForMissingOrMistypedKeys) {
    ConfigLoader cfg(Write("fulfillment:\n  lockTtlSeconds: soon\n  lowStockThreshold: 4\n"));

    EXPECT_EQ(cfg.getPath("fulfillment.lowStockThreshold", 0), 4);
    EXPECT_EQ(cfg.getPath("fulfillment.lockTtlSeconds", 30), 30);
    EXPECT_EQ(cfg.getPath("fulfillment.missing.deeper", 7), 7);
    EXPECT_EQ(cfg.getPath<std::string>("serviceName", "fallback"), "fallback");
    EXPECT_TRUE(cfg.has("fulfillment.lowStockThreshold"));
    EXPECT_FALSE(cfg.has("fulfillment.nothing"));

    // 读取不会改写配置树
    EXPECT_EQ(cfg.getPath("fulfillment.lowStockThreshold", 0), 4);
}
