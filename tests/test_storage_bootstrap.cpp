#include <gtest/gtest.h>
#include "storage/storage_bootstrap.h"
#include "storage/storage_error.h"

#include <filesystem>

namespace fs = std::filesystem;
using namespace vesta;
using namespace vesta::storage;

class StorageBootstrapTest : public ::testing::Test {
protected:
    std::string test_path_ = "./test_storage_bootstrap";
    utils::StorageConfig config_;

    void SetUp() override {
        if (fs::exists(test_path_)) {
            fs::remove_all(test_path_);
        }
        config_.file.storage_dir = test_path_;
        // Nothing listens on port 1
        config_.mongodb.uri = "mongodb://127.0.0.1:1";
        config_.mongodb.probe_timeout = std::chrono::milliseconds(300);
    }

    void TearDown() override {
        if (fs::exists(test_path_)) {
            fs::remove_all(test_path_);
        }
    }
};

TEST_F(StorageBootstrapTest, FileModeSkipsProbe) {
    config_.mode = utils::StorageMode::FILE;
    auto adapter = StorageBootstrap::open(config_);
    ASSERT_TRUE(adapter);
    EXPECT_TRUE(adapter->isOpen());
    EXPECT_EQ(adapter->backendType(), BackendType::FILE);
    EXPECT_TRUE(fs::is_directory(test_path_));
}

TEST_F(StorageBootstrapTest, AutoModeFallsBackToFiles) {
    config_.mode = utils::StorageMode::AUTO;
    auto adapter = StorageBootstrap::open(config_);
    ASSERT_TRUE(adapter);
    EXPECT_EQ(adapter->backendName(), "file");

    adapter->insertOne("countries", Document{{"slug", "japan"}});
    EXPECT_TRUE(adapter->findById("countries", "japan").has_value());
}

TEST_F(StorageBootstrapTest, NetworkModeFailsWhenUnreachable) {
    config_.mode = utils::StorageMode::NETWORK;
    try {
        StorageBootstrap::open(config_);
        FAIL() << "expected BackendUnavailable";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::BACKEND_UNAVAILABLE);
    }
}

TEST_F(StorageBootstrapTest, ReportsCompiledInNetworkBackend) {
#ifdef VESTA_ENABLE_MONGO
    EXPECT_TRUE(StorageBootstrap::networkBackendAvailable());
#else
    EXPECT_FALSE(StorageBootstrap::networkBackendAvailable());
#endif
}
