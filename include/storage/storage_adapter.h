#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "query/aggregation.h"
#include "query/cursor.h"
#include "storage/document.h"
#include "storage/document_backend.h"
#include "storage/identity_normalizer.h"

namespace vesta {
namespace storage {

/**
 * @brief Storage Adapter
 *
 * The public storage contract. Owns exactly one backend, chosen once at
 * startup (see StorageBootstrap); callers never see which one answered.
 *
 * Every document handed back is identity-normalized with the profile
 * registered for its collection. Operations before open() or after
 * close() throw StorageError(NOT_CONNECTED).
 *
 * Thread-Safety: none beyond what the backend offers; the adapter keeps
 * no per-call state.
 */
class StorageAdapter {
public:
    explicit StorageAdapter(std::unique_ptr<IDocumentBackend> backend);
    ~StorageAdapter();

    StorageAdapter(const StorageAdapter&) = delete;
    StorageAdapter& operator=(const StorageAdapter&) = delete;

    // ===== Lifecycle =====

    void open();
    void close();
    bool isOpen() const;
    std::string backendName() const;
    BackendType backendType() const;

    /// Normalization profile for a collection; unregistered collections use the default profile
    void registerCollection(const std::string& collection, CollectionProfile profile);
    const IdentityNormalizer& normalizerFor(const std::string& collection) const;

    // ===== Queries =====

    std::optional<Document> findOne(const std::string& collection, const Filter& filter);

    /// Keyed lookup: external "id" first, then the backend-native id
    std::optional<Document> findById(const std::string& collection, const std::string& id);

    std::unique_ptr<query::Cursor> find(const std::string& collection,
                                        const Filter& filter = Filter::object(),
                                        size_t skip = 0, size_t limit = 0,
                                        std::optional<SortSpec> sort = std::nullopt);

    int64_t countDocuments(const std::string& collection, const Filter& filter = Filter::object());

    std::vector<nlohmann::ordered_json> distinct(const std::string& collection, const std::string& field,
                                                 const Filter& filter = Filter::object());

    std::unique_ptr<query::Cursor> aggregate(const std::string& collection, const query::Pipeline& pipeline);

    std::vector<Document> textSearch(const std::string& collection, const std::string& term,
                                     size_t limit = 10);

    // ===== Mutations =====

    /// Assigns the external id when absent; InsertResult carries that id
    InsertResult insertOne(const std::string& collection, Document doc);

    UpdateResult updateOne(const std::string& collection, const Filter& filter, const UpdateSpec& update);

    std::optional<Document> findOneAndUpdate(const std::string& collection, const Filter& filter,
                                             const UpdateSpec& update,
                                             ReturnDocument which = ReturnDocument::AFTER);

    DeleteResult deleteOne(const std::string& collection, const Filter& filter);
    DeleteResult deleteMany(const std::string& collection, const Filter& filter);

    // ===== Administration =====

    void ensureIndexes(const std::string& collection, const std::vector<IndexSpec>& indexes);
    bool dropCollection(const std::string& collection);
    std::vector<std::string> listCollections();

private:
    IDocumentBackend& backend() const;
    query::Cursor::Transform normalizeTransform(const std::string& collection, bool identity_only) const;

    std::unique_ptr<IDocumentBackend> backend_;
    IdentityNormalizer default_normalizer_;
    std::map<std::string, IdentityNormalizer> normalizers_;
};

} // namespace storage
} // namespace vesta
