#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "query/aggregation.h"
#include "query/cursor.h"
#include "storage/document.h"

namespace vesta {
namespace storage {

/**
 * @brief Backend Type
 */
enum class BackendType {
    FILE,     // one JSON file per collection
    NETWORK   // remote MongoDB through mongocxx
};

inline const char* backendTypeName(BackendType type);

/**
 * @brief Document Storage Backend Interface
 *
 * Abstract interface behind the StorageAdapter. Implementations return
 * documents in their backend-native shape (including "_id"); identity
 * normalization happens in the adapter.
 *
 * Lookup misses return std::nullopt / zero counts. Structural failures
 * throw StorageError.
 */
class IDocumentBackend {
public:
    virtual ~IDocumentBackend() = default;

    /**
     * @brief Acquire resources (directories, connection pool)
     * @throws StorageError (IO_FAILURE or BACKEND_UNAVAILABLE)
     */
    virtual void open() = 0;

    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    virtual BackendType type() const = 0;

    /**
     * @brief Get backend name
     * @return "file" or "mongodb"
     */
    virtual std::string name() const = 0;

    virtual std::optional<Document> findOne(const std::string& collection, const Filter& filter) = 0;

    /// Lazy cursor; nothing is read until toList()
    virtual std::unique_ptr<query::Cursor> find(const std::string& collection, const Filter& filter) = 0;

    /**
     * @brief Insert a document, assigning the native "_id" when absent
     * @return InsertResult carrying the native id as a string
     */
    virtual InsertResult insertOne(const std::string& collection, Document doc) = 0;

    virtual UpdateResult updateOne(const std::string& collection, const Filter& filter,
                                   const UpdateSpec& update) = 0;

    virtual std::optional<Document> findOneAndUpdate(const std::string& collection, const Filter& filter,
                                                     const UpdateSpec& update, ReturnDocument which) = 0;

    virtual DeleteResult deleteOne(const std::string& collection, const Filter& filter) = 0;

    /// An empty filter deletes every document of the collection
    virtual DeleteResult deleteMany(const std::string& collection, const Filter& filter) = 0;

    virtual int64_t countDocuments(const std::string& collection, const Filter& filter) = 0;

    /// Distinct non-null values of `field` among matching documents, first-seen order
    virtual std::vector<nlohmann::ordered_json> distinct(const std::string& collection,
                                                         const std::string& field,
                                                         const Filter& filter) = 0;

    virtual std::unique_ptr<query::Cursor> aggregate(const std::string& collection,
                                                     const query::Pipeline& pipeline) = 0;

    /// Ranked free-text search, at most `limit` documents (0 = unbounded)
    virtual std::vector<Document> textSearch(const std::string& collection, const std::string& term,
                                             size_t limit) = 0;

    /// Filter selecting a document by its native identifier given in string form
    virtual Filter nativeIdFilter(const std::string& id) const = 0;

    virtual void ensureIndexes(const std::string& collection, const std::vector<IndexSpec>& indexes) = 0;

    /// @return true if the collection existed
    virtual bool dropCollection(const std::string& collection) = 0;

    virtual std::vector<std::string> listCollections() = 0;
};

inline const char* backendTypeName(BackendType type) {
    switch (type) {
        case BackendType::FILE: return "file";
        case BackendType::NETWORK: return "network";
    }
    return "unknown";
}

} // namespace storage
} // namespace vesta
