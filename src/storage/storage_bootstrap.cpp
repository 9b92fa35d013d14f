#include "storage/storage_bootstrap.h"
#include "storage/file_backend.h"
#include "storage/storage_error.h"
#include "utils/logger.h"

#ifdef VESTA_ENABLE_MONGO
#include "storage/mongo_backend.h"
#endif

namespace vesta {
namespace storage {

bool StorageBootstrap::networkBackendAvailable() {
#ifdef VESTA_ENABLE_MONGO
    return true;
#else
    return false;
#endif
}

std::unique_ptr<IDocumentBackend> StorageBootstrap::openNetwork(const utils::StorageConfig& config) {
#ifdef VESTA_ENABLE_MONGO
    MongoBackend::Config mongo;
    mongo.uri = config.mongodb.uri;
    mongo.database = config.mongodb.database;
    mongo.max_pool_size = config.mongodb.max_pool_size;
    mongo.probe_timeout = config.mongodb.probe_timeout;

    auto backend = std::make_unique<MongoBackend>(std::move(mongo));
    backend->open();
    return backend;
#else
    (void)config;
    throw StorageError(ErrorCode::BACKEND_UNAVAILABLE, "network backend not compiled in");
#endif
}

std::unique_ptr<IDocumentBackend> StorageBootstrap::openFile(const utils::StorageConfig& config) {
    auto backend = std::make_unique<FileBackend>(config.file.storage_dir);
    backend->open();
    return backend;
}

std::unique_ptr<StorageAdapter> StorageBootstrap::open(const utils::StorageConfig& config) {
    std::unique_ptr<IDocumentBackend> backend;

    switch (config.mode) {
        case utils::StorageMode::FILE:
            backend = openFile(config);
            break;

        case utils::StorageMode::NETWORK:
            backend = openNetwork(config);
            break;

        case utils::StorageMode::AUTO:
            try {
                backend = openNetwork(config);
            } catch (const StorageError& e) {
                if (e.code() != ErrorCode::BACKEND_UNAVAILABLE) throw;
                VESTA_WARN("Network storage unavailable ({}); falling back to file storage in {}",
                           e.what(), config.file.storage_dir);
                backend = openFile(config);
            }
            break;
    }

    VESTA_INFO("Storage backend selected: {} ({})", backend->name(), backendTypeName(backend->type()));
    auto adapter = std::make_unique<StorageAdapter>(std::move(backend));
    adapter->open();
    return adapter;
}

} // namespace storage
} // namespace vesta
