#pragma once

#include <memory>

#include "storage/storage_adapter.h"
#include "utils/storage_config.h"

namespace vesta {
namespace storage {

/**
 * @brief Startup backend selection
 *
 * Chooses the backend exactly once per process:
 * - AUTO: probe the network backend; on failure log a warning and use files
 * - NETWORK: probe; failure throws StorageError(BACKEND_UNAVAILABLE)
 * - FILE: no probe
 *
 * The returned adapter is already open.
 */
class StorageBootstrap {
public:
    static std::unique_ptr<StorageAdapter> open(const utils::StorageConfig& config);

    /// True when the network backend was compiled into this build
    static bool networkBackendAvailable();

private:
    static std::unique_ptr<IDocumentBackend> openNetwork(const utils::StorageConfig& config);
    static std::unique_ptr<IDocumentBackend> openFile(const utils::StorageConfig& config);
};

} // namespace storage
} // namespace vesta
