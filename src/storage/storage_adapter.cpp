#include "storage/storage_adapter.h"
#include "storage/storage_error.h"
#include "utils/logger.h"

namespace vesta {
namespace storage {

StorageAdapter::StorageAdapter(std::unique_ptr<IDocumentBackend> backend)
    : backend_(std::move(backend)) {}

StorageAdapter::~StorageAdapter() {
    try {
        close();
    } catch (const std::exception& e) {
        VESTA_ERROR("StorageAdapter: close during destruction failed: {}", e.what());
    }
}

void StorageAdapter::open() {
    if (!backend_) {
        throw StorageError(ErrorCode::NOT_CONNECTED, "no backend configured");
    }
    if (!backend_->isOpen()) {
        backend_->open();
    }
    VESTA_INFO("StorageAdapter ready: backend={}", backend_->name());
}

void StorageAdapter::close() {
    if (backend_ && backend_->isOpen()) {
        backend_->close();
        VESTA_INFO("StorageAdapter closed: backend={}", backend_->name());
    }
}

bool StorageAdapter::isOpen() const {
    return backend_ && backend_->isOpen();
}

std::string StorageAdapter::backendName() const {
    return backend_ ? backend_->name() : std::string("none");
}

BackendType StorageAdapter::backendType() const {
    return backend().type();
}

IDocumentBackend& StorageAdapter::backend() const {
    if (!backend_ || !backend_->isOpen()) {
        throw StorageError(ErrorCode::NOT_CONNECTED, "storage adapter is not open");
    }
    return *backend_;
}

void StorageAdapter::registerCollection(const std::string& collection, CollectionProfile profile) {
    normalizers_.insert_or_assign(collection, IdentityNormalizer(std::move(profile)));
}

const IdentityNormalizer& StorageAdapter::normalizerFor(const std::string& collection) const {
    auto it = normalizers_.find(collection);
    return it == normalizers_.end() ? default_normalizer_ : it->second;
}

query::Cursor::Transform StorageAdapter::normalizeTransform(const std::string& collection,
                                                            bool identity_only) const {
    // Copy: the cursor may outlive a later registerCollection() call
    IdentityNormalizer normalizer = normalizerFor(collection);
    if (identity_only) {
        return [normalizer](Document& d) { normalizer.normalizeIdentity(d); };
    }
    return [normalizer](Document& d) { normalizer.normalize(d); };
}

std::optional<Document> StorageAdapter::findOne(const std::string& collection, const Filter& filter) {
    auto doc = backend().findOne(collection, filter);
    if (doc) {
        normalizerFor(collection).normalize(*doc);
    }
    return doc;
}

std::optional<Document> StorageAdapter::findById(const std::string& collection, const std::string& id) {
    auto& be = backend();
    auto doc = be.findOne(collection, Filter{{IdentityNormalizer::EXTERNAL_ID, id}});
    if (!doc) {
        doc = be.findOne(collection, be.nativeIdFilter(id));
    }
    if (doc) {
        normalizerFor(collection).normalize(*doc);
    }
    return doc;
}

std::unique_ptr<query::Cursor> StorageAdapter::find(const std::string& collection, const Filter& filter,
                                                    size_t skip, size_t limit, std::optional<SortSpec> sort) {
    auto cursor = backend().find(collection, filter);
    cursor->skip(skip).limit(limit);
    if (sort) {
        cursor->sort(*sort);
    }
    cursor->setTransform(normalizeTransform(collection, false));
    return cursor;
}

int64_t StorageAdapter::countDocuments(const std::string& collection, const Filter& filter) {
    return backend().countDocuments(collection, filter);
}

std::vector<nlohmann::ordered_json> StorageAdapter::distinct(const std::string& collection,
                                                             const std::string& field, const Filter& filter) {
    return backend().distinct(collection, field, filter);
}

std::unique_ptr<query::Cursor> StorageAdapter::aggregate(const std::string& collection,
                                                         const query::Pipeline& pipeline) {
    auto cursor = backend().aggregate(collection, pipeline);
    cursor->setTransform(normalizeTransform(collection, true));
    return cursor;
}

std::vector<Document> StorageAdapter::textSearch(const std::string& collection, const std::string& term,
                                                 size_t limit) {
    auto docs = backend().textSearch(collection, term, limit);
    const auto& normalizer = normalizerFor(collection);
    for (auto& d : docs) {
        normalizer.normalize(d);
    }
    return docs;
}

InsertResult StorageAdapter::insertOne(const std::string& collection, Document doc) {
    auto& be = backend();
    if (!doc.is_object()) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "only JSON objects can be inserted");
    }
    std::string external_id = normalizerFor(collection).assignIdentity(doc);
    auto native = be.insertOne(collection, std::move(doc));
    VESTA_DEBUG("StorageAdapter: inserted {} (native {}) into {}", external_id, native.id, collection);
    return InsertResult{external_id};
}

UpdateResult StorageAdapter::updateOne(const std::string& collection, const Filter& filter,
                                       const UpdateSpec& update) {
    return backend().updateOne(collection, filter, update);
}

std::optional<Document> StorageAdapter::findOneAndUpdate(const std::string& collection, const Filter& filter,
                                                         const UpdateSpec& update, ReturnDocument which) {
    auto doc = backend().findOneAndUpdate(collection, filter, update, which);
    if (doc) {
        normalizerFor(collection).normalize(*doc);
    }
    return doc;
}

DeleteResult StorageAdapter::deleteOne(const std::string& collection, const Filter& filter) {
    return backend().deleteOne(collection, filter);
}

DeleteResult StorageAdapter::deleteMany(const std::string& collection, const Filter& filter) {
    return backend().deleteMany(collection, filter);
}

void StorageAdapter::ensureIndexes(const std::string& collection, const std::vector<IndexSpec>& indexes) {
    backend().ensureIndexes(collection, indexes);
}

bool StorageAdapter::dropCollection(const std::string& collection) {
    return backend().dropCollection(collection);
}

std::vector<std::string> StorageAdapter::listCollections() {
    return backend().listCollections();
}

} // namespace storage
} // namespace vesta
