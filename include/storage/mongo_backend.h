#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <mongocxx/pool.hpp>

#include "storage/document_backend.h"

namespace vesta {
namespace storage {

/**
 * @brief MongoDB Document Backend
 *
 * Thin adapter over the mongocxx driver. Connections come from a
 * mongocxx::pool of fixed, small size. open() doubles as the startup
 * connectivity probe: it pings the server within `probe_timeout` and
 * throws StorageError(BACKEND_UNAVAILABLE) on failure.
 *
 * Documents cross the driver boundary as relaxed extended JSON; ObjectId
 * and date wrappers are flattened to their canonical string forms.
 */
class MongoBackend : public IDocumentBackend {
public:
    struct Config {
        std::string uri = "mongodb://localhost:27017";
        std::string database = "vesta";
        int max_pool_size = 10;
        std::chrono::milliseconds probe_timeout{10000};
    };

    explicit MongoBackend(Config config);
    ~MongoBackend() override;

    void open() override;
    void close() override;
    bool isOpen() const override { return pool_ != nullptr; }
    BackendType type() const override { return BackendType::NETWORK; }
    std::string name() const override { return "mongodb"; }

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

    // ===== JSON translation (public for testing) =====

    /// Driver-ready filter: string-form "$text" becomes {"$search": term}
    static Filter toDriverFilter(const Filter& filter);

    /// Stage array for coll.aggregate(); every $match goes through toDriverFilter()
    static nlohmann::ordered_json toDriverPipeline(const query::Pipeline& pipeline);

    /// Flatten relaxed extended JSON wrappers ($oid, $date, $numberLong, ...)
    static Document fromExtendedJson(Document value);

    /// `uri` with pool size and timeout options appended unless already present
    static std::string effectiveUri(const Config& config);

private:
    std::shared_ptr<mongocxx::pool> requirePool() const;

    Config config_;
    std::shared_ptr<mongocxx::pool> pool_;
};

} // namespace storage
} // namespace vesta
