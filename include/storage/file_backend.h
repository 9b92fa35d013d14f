#pragma once

#include <string>
#include <vector>

#include "storage/document_backend.h"

namespace vesta {
namespace storage {

/**
 * @brief Flat-file Document Backend
 *
 * Stores each collection as one JSON array:
 *   storage_dir/<collection>.json
 *
 * Every mutation reads the whole file, mutates the array in memory and
 * replaces the file (write to <collection>.json.tmp, then rename). There is
 * no locking: two uncoordinated writers race and the later full-snapshot
 * write wins.
 *
 * Filters, updates and pipelines are limited to the closed grammar of
 * FilterMatcher / UpdateApplier / AggregationEngine.
 */
class FileBackend : public IDocumentBackend {
public:
    explicit FileBackend(std::string storage_dir);

    void open() override;
    void close() override;
    bool isOpen() const override { return open_; }
    BackendType type() const override { return BackendType::FILE; }
    std::string name() const override { return "file"; }

    std::optional<Document> findOne(const std::string& collection, const Filter& filter) override;
    std::unique_ptr<query::Cursor> find(const std::string& collection, const Filter& filter) override;
    InsertResult insertOne(const std::string& collection, Document doc) override;
    UpdateResult updateOne(const std::string& collection, const Filter& filter,
                           const UpdateSpec& update) override;
    std::optional<Document> findOneAndUpdate(const std::string& collection, const Filter& filter,
                                             const UpdateSpec& update, ReturnDocument which) override;
    DeleteResult deleteOne(const std::string& collection, const Filter& filter) override;
    DeleteResult deleteMany(const std::string& collection, const Filter& filter) override;
    int64_t countDocuments(const std::string& collection, const Filter& filter) override;
    std::vector<nlohmann::ordered_json> distinct(const std::string& collection, const std::string& field,
                                                 const Filter& filter) override;
    std::unique_ptr<query::Cursor> aggregate(const std::string& collection,
                                             const query::Pipeline& pipeline) override;
    std::vector<Document> textSearch(const std::string& collection, const std::string& term,
                                     size_t limit) override;
    Filter nativeIdFilter(const std::string& id) const override;
    void ensureIndexes(const std::string& collection, const std::vector<IndexSpec>& indexes) override;
    bool dropCollection(const std::string& collection) override;
    std::vector<std::string> listCollections() override;

    // ===== Snapshot access =====

    /// Read the full collection; a missing file is an empty collection.
    /// @throws StorageError (IO_FAILURE) if the file cannot be read or is not a JSON array
    std::vector<Document> loadCollection(const std::string& collection) const;

    /// Replace the full collection with `docs`.
    /// @throws StorageError (IO_FAILURE) on write failure
    void saveCollection(const std::string& collection, const std::vector<Document>& docs) const;

    std::string collectionPath(const std::string& collection) const;
    const std::string& storageDir() const { return storage_dir_; }

private:
    static void validateCollectionName(const std::string& collection);

    std::string storage_dir_;
    bool open_ = false;
};

} // namespace storage
} // namespace vesta
