#include "utils/storage_config.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace vesta {
namespace utils {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

StorageMode parseMode(const std::string& s) {
    auto mode = storageModeFromString(s);
    if (!mode) {
        throw std::invalid_argument("unknown storage mode: " + s);
    }
    return *mode;
}

} // namespace

const char* storageModeToString(StorageMode mode) {
    switch (mode) {
        case StorageMode::AUTO: return "auto";
        case StorageMode::NETWORK: return "network";
        case StorageMode::FILE: return "file";
    }
    return "auto";
}

std::optional<StorageMode> storageModeFromString(const std::string& s) {
    const std::string v = toLower(s);
    if (v == "auto") return StorageMode::AUTO;
    if (v == "network" || v == "mongodb") return StorageMode::NETWORK;
    if (v == "file") return StorageMode::FILE;
    return std::nullopt;
}

std::string maskUriCredentials(const std::string& uri) {
    auto scheme = uri.find("://");
    auto at = uri.find('@');
    if (scheme == std::string::npos || at == std::string::npos || at < scheme) return uri;
    return uri.substr(0, scheme + 3) + "***" + uri.substr(at);
}

StorageConfig StorageConfig::loadFromYaml(const std::string& yaml_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(yaml_path);
    } catch (const YAML::Exception& e) {
        VESTA_ERROR("Failed to load storage configuration from {}: {}", yaml_path, e.what());
        throw std::runtime_error("cannot load " + yaml_path + ": " + e.what());
    }

    StorageConfig result;
    auto storage = config["storage"] ? config["storage"] : config;

    if (storage["mode"]) {
        result.mode = parseMode(storage["mode"].as<std::string>());
    }

    if (storage["mongodb"]) {
        auto mongodb = storage["mongodb"];
        result.mongodb.uri = mongodb["uri"].as<std::string>(result.mongodb.uri);
        result.mongodb.database = mongodb["database"].as<std::string>(result.mongodb.database);
        result.mongodb.max_pool_size = mongodb["max_pool_size"].as<int>(10);
        result.mongodb.probe_timeout = std::chrono::milliseconds(
            mongodb["probe_timeout_ms"].as<int>(10000)
        );
    }

    if (storage["file"]) {
        result.file.storage_dir = storage["file"]["storage_dir"].as<std::string>(result.file.storage_dir);
    }

    if (config["logging"]) {
        auto logging = config["logging"];
        result.logging.level = logging["level"].as<std::string>("info");
        result.logging.file = logging["file"].as<std::string>("");
    }

    VESTA_INFO("Loaded storage configuration from {}", yaml_path);
    return result;
}

StorageConfig StorageConfig::fromJson(const json& j) {
    StorageConfig result;

    if (j.contains("mode")) {
        result.mode = parseMode(j["mode"].get<std::string>());
    }

    if (j.contains("mongodb")) {
        const auto& mongodb = j["mongodb"];
        result.mongodb.uri = mongodb.value("uri", result.mongodb.uri);
        result.mongodb.database = mongodb.value("database", result.mongodb.database);
        result.mongodb.max_pool_size = mongodb.value("max_pool_size", 10);
        result.mongodb.probe_timeout = std::chrono::milliseconds(
            mongodb.value("probe_timeout_ms", 10000)
        );
    }

    if (j.contains("file")) {
        result.file.storage_dir = j["file"].value("storage_dir", result.file.storage_dir);
    }

    if (j.contains("logging")) {
        result.logging.level = j["logging"].value("level", "info");
        result.logging.file = j["logging"].value("file", "");
    }

    return result;
}

json StorageConfig::toJson() const {
    json j;
    j["mode"] = storageModeToString(mode);

    j["mongodb"]["uri"] = maskUriCredentials(mongodb.uri);
    j["mongodb"]["database"] = mongodb.database;
    j["mongodb"]["max_pool_size"] = mongodb.max_pool_size;
    j["mongodb"]["probe_timeout_ms"] = mongodb.probe_timeout.count();

    j["file"]["storage_dir"] = file.storage_dir;

    j["logging"]["level"] = logging.level;
    if (!logging.file.empty()) {
        j["logging"]["file"] = logging.file;
    }
    return j;
}

void StorageConfig::applyEnvironment() {
    if (auto v = env("MONGODB_URL")) mongodb.uri = *v;
    if (auto v = env("DATABASE_NAME")) mongodb.database = *v;
    if (auto v = env("VESTA_STORAGE_DIR")) file.storage_dir = *v;
    if (auto v = env("VESTA_LOG_LEVEL")) logging.level = *v;
    if (auto v = env("VESTA_STORAGE_MODE")) {
        if (auto m = storageModeFromString(*v)) {
            mode = *m;
        } else {
            VESTA_WARN("Ignoring VESTA_STORAGE_MODE={}: expected auto, network or file", *v);
        }
    }
}

} // namespace utils
} // namespace vesta
