#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace vesta {
namespace utils {

using json = nlohmann::json;

/**
 * @brief Backend selection mode
 */
enum class StorageMode {
    AUTO,     // probe the network backend, fall back to files
    NETWORK,  // network backend only; unreachable server is fatal
    FILE      // file backend only, no probe
};

const char* storageModeToString(StorageMode mode);

/// "auto" / "network" / "file" (case-insensitive); nullopt on anything else
std::optional<StorageMode> storageModeFromString(const std::string& s);

/// Connection URI with user:password replaced by "***"
std::string maskUriCredentials(const std::string& uri);

/**
 * @brief Configuration for the storage layer and its logging
 */
struct StorageConfig {
    StorageMode mode = StorageMode::AUTO;

    struct MongoConfig {
        std::string uri = "mongodb://localhost:27017";
        std::string database = "vesta";
        int max_pool_size = 10;                          // Fixed, small pool
        std::chrono::milliseconds probe_timeout{10000};  // Startup connectivity probe
    } mongodb;

    struct FileConfig {
        std::string storage_dir = "data_storage";        // One <collection>.json per collection
    } file;

    struct LoggingConfig {
        std::string level = "info";
        std::string file;                                // Empty = console only
    } logging;

    /**
     * @brief Load configuration from YAML file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static StorageConfig loadFromYaml(const std::string& yaml_path);

    /**
     * @brief Load configuration from JSON
     */
    static StorageConfig fromJson(const json& j);

    /**
     * @brief Convert to JSON (credentials in the URI are masked)
     */
    json toJson() const;

    /**
     * @brief Apply MONGODB_URL, DATABASE_NAME, VESTA_STORAGE_MODE,
     *        VESTA_STORAGE_DIR and VESTA_LOG_LEVEL when set
     */
    void applyEnvironment();
};

} // namespace utils
} // namespace vesta
