#include "storage/mongo_backend.h"
#include "query/update_applier.h"
#include "storage/identity_normalizer.h"
#include "storage/storage_error.h"
#include "utils/id_generator.h"
#include "utils/logger.h"
#include "utils/storage_config.h"
#include "utils/time_utils.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/oid.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/aggregate.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/find_one_and_update.hpp>
#include <mongocxx/pipeline.hpp>
#include <mongocxx/uri.hpp>

namespace vesta {
namespace storage {

using json = nlohmann::ordered_json;
using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace {

// One driver instance per process; must outlive every pool
mongocxx::instance& driverInstance() {
    static mongocxx::instance instance{};
    return instance;
}

bsoncxx::document::value toBson(const json& j) {
    try {
        return bsoncxx::from_json(j.dump());
    } catch (const bsoncxx::exception& e) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY,
            std::string("cannot convert to BSON: ") + e.what());
    }
}

Document toDocument(bsoncxx::document::view view) {
    return MongoBackend::fromExtendedJson(
        Document::parse(bsoncxx::to_json(view, bsoncxx::ExtendedJsonMode::k_relaxed)));
}

bool hasUpdateOperator(const UpdateSpec& update) {
    if (!update.is_object()) return false;
    for (auto it = update.begin(); it != update.end(); ++it) {
        if (!it.key().empty() && it.key()[0] == '$') return true;
    }
    return false;
}

template<typename Fn>
auto driverCall(const char* op, const std::string& collection, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const mongocxx::exception& e) {
        VESTA_ERROR("MongoBackend::{} on {} failed: {}", op, collection, e.what());
        throw StorageError(ErrorCode::DRIVER_ERROR,
            std::string(op) + " on " + collection + " failed: " + e.what());
    }
}

std::vector<Document> drain(mongocxx::cursor& cursor) {
    std::vector<Document> out;
    for (auto&& view : cursor) {
        out.push_back(toDocument(view));
    }
    return out;
}

size_t effectiveLimit(size_t limit, std::optional<size_t> length) {
    if (length && *length > 0 && (limit == 0 || *length < limit)) return *length;
    return limit;
}

/// Cursor forwarding skip/limit/sort to mongocxx::options::find
class MongoCursor : public query::Cursor {
public:
    MongoCursor(std::shared_ptr<mongocxx::pool> pool, std::string database, std::string collection, Filter filter)
        : Cursor(std::move(filter))
        , pool_(std::move(pool))
        , database_(std::move(database))
        , collection_(std::move(collection)) {}

protected:
    std::vector<Document> fetch(const query::CursorState& state, std::optional<size_t> length) override {
        mongocxx::options::find opts;
        if (state.skip > 0) {
            opts.skip(static_cast<int64_t>(state.skip));
        }
        if (size_t limit = effectiveLimit(state.limit, length); limit > 0) {
            opts.limit(static_cast<int64_t>(limit));
        }
        if (state.sort && !state.sort->field.empty()) {
            if (state.sort->field == "_id") {
                opts.sort(make_document(kvp("_id", state.sort->asInt())));
            } else {
                // _id tiebreak keeps equal keys in insertion order
                opts.sort(make_document(kvp(state.sort->field, state.sort->asInt()), kvp("_id", 1)));
            }
        }

        return driverCall("find", collection_, [&]() {
            auto client = pool_->acquire();
            auto coll = (*client)[database_][collection_];
            auto cursor = coll.find(toBson(MongoBackend::toDriverFilter(state.filter)), opts);
            return drain(cursor);
        });
    }

private:
    std::shared_ptr<mongocxx::pool> pool_;
    std::string database_;
    std::string collection_;
};

/// Server-side pipeline; a chained sort/skip/limit becomes trailing stages
class MongoAggregationCursor : public query::Cursor {
public:
    MongoAggregationCursor(std::shared_ptr<mongocxx::pool> pool, std::string database, std::string collection,
                           json stages)
        : Cursor(Filter::object())
        , pool_(std::move(pool))
        , database_(std::move(database))
        , collection_(std::move(collection))
        , stages_(std::move(stages)) {}

protected:
    std::vector<Document> fetch(const query::CursorState& state, std::optional<size_t> length) override {
        mongocxx::pipeline pipeline;
        for (const auto& stage : stages_) {
            pipeline.append_stage(toBson(stage));
        }
        if (state.sort && !state.sort->field.empty()) {
            pipeline.sort(make_document(kvp(state.sort->field, state.sort->asInt())));
        }
        if (state.skip > 0) {
            pipeline.skip(static_cast<int32_t>(state.skip));
        }
        if (size_t limit = effectiveLimit(state.limit, length); limit > 0) {
            pipeline.limit(static_cast<int32_t>(limit));
        }

        return driverCall("aggregate", collection_, [&]() {
            auto client = pool_->acquire();
            auto coll = (*client)[database_][collection_];
            auto cursor = coll.aggregate(pipeline, mongocxx::options::aggregate{});
            return drain(cursor);
        });
    }

private:
    std::shared_ptr<mongocxx::pool> pool_;
    std::string database_;
    std::string collection_;
    json stages_;
};

} // namespace

MongoBackend::MongoBackend(Config config)
    : config_(std::move(config)) {}

MongoBackend::~MongoBackend() {
    close();
}

std::string MongoBackend::effectiveUri(const Config& config) {
    std::string uri = config.uri;
    std::string lower = uri;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::pair<std::string, std::string> defaults[] = {
        {"maxPoolSize", std::to_string(config.max_pool_size)},
        {"serverSelectionTimeoutMS", std::to_string(config.probe_timeout.count())},
        {"connectTimeoutMS", std::to_string(config.probe_timeout.count())},
    };

    for (const auto& [key, value] : defaults) {
        std::string lkey = key;
        std::transform(lkey.begin(), lkey.end(), lkey.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower.find(lkey + "=") != std::string::npos) continue;

        if (uri.find('?') != std::string::npos) {
            uri += "&";
        } else {
            auto scheme = uri.find("://");
            auto slash = uri.find('/', scheme == std::string::npos ? 0 : scheme + 3);
            uri += (slash == std::string::npos) ? "/?" : "?";
        }
        uri += key + "=" + value;
    }
    return uri;
}

void MongoBackend::open() {
    if (pool_) return;

    driverInstance();
    const std::string uri = effectiveUri(config_);
    VESTA_INFO("MongoBackend: probing {} (timeout {} ms)", utils::maskUriCredentials(uri), config_.probe_timeout.count());

    try {
        auto pool = std::make_shared<mongocxx::pool>(mongocxx::uri{uri});
        {
            auto client = pool->acquire();
            (*client)["admin"].run_command(make_document(kvp("ping", 1)));
        }
        pool_ = std::move(pool);
    } catch (const mongocxx::exception& e) {
        VESTA_WARN("MongoBackend: server unreachable: {}", e.what());
        throw StorageError(ErrorCode::BACKEND_UNAVAILABLE, std::string("MongoDB unreachable: ") + e.what());
    }

    VESTA_INFO("MongoBackend opened: database={}, pool size={}", config_.database, config_.max_pool_size);
}

void MongoBackend::close() {
    if (pool_) {
        pool_.reset();
        VESTA_INFO("MongoBackend closed");
    }
}

std::shared_ptr<mongocxx::pool> MongoBackend::requirePool() const {
    if (!pool_) {
        throw StorageError(ErrorCode::NOT_CONNECTED, "MongoDB backend is not open");
    }
    return pool_;
}

Filter MongoBackend::toDriverFilter(const Filter& filter) {
    if (!filter.is_object()) return Filter::object();
    Filter out = filter;
    auto it = out.find("$text");
    if (it != out.end() && it->is_string()) {
        *it = json{{"$search", it->get<std::string>()}};
    }
    return out;
}

json MongoBackend::toDriverPipeline(const query::Pipeline& pipeline) {
    json stages = pipeline.toJson();
    for (auto& stage : stages) {
        auto it = stage.find("$match");
        if (it != stage.end()) {
            *it = toDriverFilter(*it);
        }
    }
    return stages;
}

Document MongoBackend::fromExtendedJson(Document value) {
    if (value.is_object()) {
        if (value.size() == 1) {
            auto it = value.begin();
            const std::string& key = it.key();
            const json& v = it.value();
            if (key == "$oid" && v.is_string()) {
                return v;
            }
            if (key == "$date") {
                if (v.is_string()) return v;
                if (v.is_number()) return utils::epochMillisToIso8601(v.get<int64_t>());
                if (v.is_object() && v.contains("$numberLong") && v["$numberLong"].is_string()) {
                    return utils::epochMillisToIso8601(std::stoll(v["$numberLong"].get<std::string>()));
                }
            }
            if (key == "$numberLong" && v.is_string()) {
                return static_cast<int64_t>(std::stoll(v.get<std::string>()));
            }
            if ((key == "$numberDecimal" || key == "$numberDouble") && v.is_string()) {
                return v;
            }
        }
        for (auto it = value.begin(); it != value.end(); ++it) {
            *it = fromExtendedJson(std::move(*it));
        }
    } else if (value.is_array()) {
        for (auto& element : value) {
            element = fromExtendedJson(std::move(element));
        }
    }
    return value;
}

std::optional<Document> MongoBackend::findOne(const std::string& collection, const Filter& filter) {
    auto pool = requirePool();
    return driverCall("find_one", collection, [&]() -> std::optional<Document> {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        auto result = coll.find_one(toBson(toDriverFilter(filter)));
        if (!result) return std::nullopt;
        return toDocument(result->view());
    });
}

std::unique_ptr<query::Cursor> MongoBackend::find(const std::string& collection, const Filter& filter) {
    return std::make_unique<MongoCursor>(requirePool(), config_.database, collection, filter);
}

InsertResult MongoBackend::insertOne(const std::string& collection, Document doc) {
    if (!doc.is_object()) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "only JSON objects can be inserted");
    }
    auto pool = requirePool();

    // Generate the ObjectId client-side so the native id is known without
    // inspecting the driver's result type
    if (!doc.contains("_id") || doc["_id"].is_null()) {
        doc["_id"] = json{{"$oid", bsoncxx::oid{}.to_string()}};
    }
    InsertResult result{IdentityNormalizer::nativeIdToString(doc["_id"])};

    driverCall("insert_one", collection, [&]() {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        coll.insert_one(toBson(doc));
    });
    return result;
}

UpdateResult MongoBackend::updateOne(const std::string& collection, const Filter& filter,
                                     const UpdateSpec& update) {
    auto pool = requirePool();
    const UpdateSpec driver_update = hasUpdateOperator(update) ? update : query::UpdateApplier::toSetOperator(update);

    return driverCall("update_one", collection, [&]() {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        auto res = coll.update_one(toBson(toDriverFilter(filter)), toBson(driver_update));
        UpdateResult out;
        if (res) {
            out.matched_count = res->matched_count();
            out.modified_count = res->modified_count();
        }
        return out;
    });
}

std::optional<Document> MongoBackend::findOneAndUpdate(const std::string& collection, const Filter& filter,
                                                        const UpdateSpec& update, ReturnDocument which) {
    auto pool = requirePool();
    const UpdateSpec driver_update = hasUpdateOperator(update) ? update : query::UpdateApplier::toSetOperator(update);

    mongocxx::options::find_one_and_update opts;
    opts.return_document(which == ReturnDocument::AFTER
                             ? mongocxx::options::return_document::k_after
                             : mongocxx::options::return_document::k_before);

    return driverCall("find_one_and_update", collection, [&]() -> std::optional<Document> {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        auto res = coll.find_one_and_update(toBson(toDriverFilter(filter)), toBson(driver_update), opts);
        if (!res) return std::nullopt;
        return toDocument(res->view());
    });
}

DeleteResult MongoBackend::deleteOne(const std::string& collection, const Filter& filter) {
    auto pool = requirePool();
    return driverCall("delete_one", collection, [&]() {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        auto res = coll.delete_one(toBson(toDriverFilter(filter)));
        return DeleteResult{res ? static_cast<int64_t>(res->deleted_count()) : 0};
    });
}

DeleteResult MongoBackend::deleteMany(const std::string& collection, const Filter& filter) {
    auto pool = requirePool();
    return driverCall("delete_many", collection, [&]() {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        auto res = coll.delete_many(toBson(toDriverFilter(filter)));
        return DeleteResult{res ? static_cast<int64_t>(res->deleted_count()) : 0};
    });
}

int64_t MongoBackend::countDocuments(const std::string& collection, const Filter& filter) {
    auto pool = requirePool();
    return driverCall("count_documents", collection, [&]() {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        return static_cast<int64_t>(coll.count_documents(toBson(toDriverFilter(filter))));
    });
}

std::vector<json> MongoBackend::distinct(const std::string& collection, const std::string& field,
                                         const Filter& filter) {
    auto pool = requirePool();
    auto rows = driverCall("distinct", collection, [&]() {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        auto cursor = coll.distinct(field, toBson(toDriverFilter(filter)));
        return drain(cursor);
    });

    std::vector<json> values;
    for (const auto& row : rows) {
        auto it = row.find("values");
        if (it == row.end() || !it->is_array()) continue;
        for (const auto& v : *it) {
            if (v.is_null()) continue;
            if (std::find(values.begin(), values.end(), v) == values.end()) {
                values.push_back(v);
            }
        }
    }
    return values;
}

std::unique_ptr<query::Cursor> MongoBackend::aggregate(const std::string& collection,
                                                       const query::Pipeline& pipeline) {
    return std::make_unique<MongoAggregationCursor>(requirePool(), config_.database, collection,
                                                    toDriverPipeline(pipeline));
}

std::vector<Document> MongoBackend::textSearch(const std::string& collection, const std::string& term,
                                               size_t limit) {
    auto cursor = find(collection, Filter{{"$text", {{"$search", term}}}});
    cursor->limit(limit);
    return cursor->toList();
}

Filter MongoBackend::nativeIdFilter(const std::string& id) const {
    if (utils::IdGenerator::isObjectIdHex(id)) {
        return Filter{{"_id", {{"$oid", id}}}};
    }
    return Filter{{"_id", id}};
}

void MongoBackend::ensureIndexes(const std::string& collection, const std::vector<IndexSpec>& indexes) {
    auto pool = requirePool();
    driverCall("create_index", collection, [&]() {
        auto client = pool->acquire();
        auto coll = (*client)[config_.database][collection];
        for (const auto& index : indexes) {
            json keys = json::object();
            for (const auto& field : index.fields) {
                keys[field] = index.text ? json("text") : json(1);
            }
            json options = json::object();
            if (index.unique) options["unique"] = true;
            coll.create_index(toBson(keys), toBson(options));
            VESTA_DEBUG("MongoBackend: ensured index {} on {}", keys.dump(), collection);
        }
    });
}

bool MongoBackend::dropCollection(const std::string& collection) {
    auto pool = requirePool();
    return driverCall("drop", collection, [&]() {
        auto client = pool->acquire();
        auto db = (*client)[config_.database];
        if (!db.has_collection(collection)) return false;
        db[collection].drop();
        VESTA_INFO("MongoBackend: dropped collection {}", collection);
        return true;
    });
}

std::vector<std::string> MongoBackend::listCollections() {
    auto pool = requirePool();
    auto names = driverCall("list_collection_names", config_.database, [&]() {
        auto client = pool->acquire();
        return (*client)[config_.database].list_collection_names();
    });
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace storage
} // namespace vesta
