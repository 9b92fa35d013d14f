#include "storage/file_backend.h"
#include "query/filter_matcher.h"
#include "query/update_applier.h"
#include "storage/storage_error.h"
#include "utils/id_generator.h"
#include "utils/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace vesta {
namespace storage {

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;
using query::FilterMatcher;
using query::UpdateApplier;

namespace {

// Relevance weights for textSearch
struct TextWeight {
    const char* field;
    int score;
};
constexpr TextWeight kTextWeights[] = {{"name", 10}, {"summary", 5}, {"region", 3}};

int textScore(const Document& doc, const std::string& term) {
    if (!doc.is_object()) return 0;
    int score = 0;
    for (const auto& w : kTextWeights) {
        auto it = doc.find(w.field);
        if (it != doc.end() && it->is_string() &&
            containsIgnoreCase(it->get_ref<const std::string&>(), term)) {
            score += w.score;
        }
    }
    return score;
}

} // namespace

FileBackend::FileBackend(std::string storage_dir)
    : storage_dir_(std::move(storage_dir)) {}

void FileBackend::open() {
    try {
        fs::create_directories(storage_dir_);
    } catch (const fs::filesystem_error& e) {
        VESTA_ERROR("FileBackend: cannot create storage directory {}: {}", storage_dir_, e.what());
        throw StorageError(ErrorCode::IO_FAILURE,
            "cannot create storage directory " + storage_dir_ + ": " + e.what());
    }
    open_ = true;
    VESTA_INFO("FileBackend opened: path={}", storage_dir_);
}

void FileBackend::close() {
    if (open_) {
        VESTA_INFO("FileBackend closed: path={}", storage_dir_);
    }
    open_ = false;
}

void FileBackend::validateCollectionName(const std::string& collection) {
    if (collection.empty() || collection == "." || collection == ".." ||
        collection.find_first_of("/\\") != std::string::npos ||
        collection.find('\0') != std::string::npos) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "invalid collection name '" + collection + "'");
    }
}

std::string FileBackend::collectionPath(const std::string& collection) const {
    validateCollectionName(collection);
    return (fs::path(storage_dir_) / (collection + ".json")).string();
}

std::vector<Document> FileBackend::loadCollection(const std::string& collection) const {
    const std::string path = collectionPath(collection);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return {};
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        VESTA_ERROR("FileBackend: cannot open {} for reading", path);
        throw StorageError(ErrorCode::IO_FAILURE, "cannot open " + path + " for reading");
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw StorageError(ErrorCode::IO_FAILURE, "read error on " + path);
    }

    const std::string content = buffer.str();
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return {};
    }

    json data;
    try {
        data = json::parse(content);
    } catch (const json::parse_error& e) {
        VESTA_ERROR("FileBackend: {} is not valid JSON: {}", path, e.what());
        throw StorageError(ErrorCode::IO_FAILURE, path + " is not valid JSON: " + e.what());
    }
    if (!data.is_array()) {
        throw StorageError(ErrorCode::IO_FAILURE, path + " does not hold a JSON array");
    }

    std::vector<Document> docs;
    docs.reserve(data.size());
    for (auto& d : data) {
        docs.push_back(std::move(d));
    }
    return docs;
}

void FileBackend::saveCollection(const std::string& collection, const std::vector<Document>& docs) const {
    const std::string path = collectionPath(collection);
    const std::string tmp = path + ".tmp";

    json arr = json::array();
    for (const auto& d : docs) {
        arr.push_back(d);
    }

    try {
        fs::create_directories(fs::path(path).parent_path());

        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw StorageError(ErrorCode::IO_FAILURE, "cannot open " + tmp + " for writing");
        }
        ofs << arr.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
        ofs.close();
        if (!ofs) {
            throw StorageError(ErrorCode::IO_FAILURE, "failed to write " + tmp);
        }

        fs::rename(tmp, path);
    } catch (const fs::filesystem_error& e) {
        VESTA_ERROR("FileBackend: saving {} failed: {}", path, e.what());
        throw StorageError(ErrorCode::IO_FAILURE, "saving " + path + " failed: " + e.what());
    } catch (const StorageError& e) {
        VESTA_ERROR("FileBackend: {}", e.what());
        throw;
    }

    VESTA_DEBUG("FileBackend: wrote {} documents to {}", docs.size(), path);
}

std::optional<Document> FileBackend::findOne(const std::string& collection, const Filter& filter) {
    FilterMatcher::validate(filter);
    for (auto& d : loadCollection(collection)) {
        if (FilterMatcher::matches(d, filter)) {
            return std::move(d);
        }
    }
    return std::nullopt;
}

std::unique_ptr<query::Cursor> FileBackend::find(const std::string& collection, const Filter& filter) {
    FilterMatcher::validate(filter);
    validateCollectionName(collection);
    return std::make_unique<query::SnapshotCursor>(filter, [this, collection]() {
        return loadCollection(collection);
    });
}

InsertResult FileBackend::insertOne(const std::string& collection, Document doc) {
    if (!doc.is_object()) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "only JSON objects can be inserted");
    }

    auto docs = loadCollection(collection);

    if (!doc.contains("_id") || doc["_id"].is_null()) {
        doc["_id"] = utils::IdGenerator::uuid4();
    }
    const json& id = doc["_id"];
    InsertResult result{id.is_string() ? id.get<std::string>() : id.dump()};

    docs.push_back(std::move(doc));
    saveCollection(collection, docs);

    VESTA_DEBUG("FileBackend: inserted {} into {}", result.id, collection);
    return result;
}

UpdateResult FileBackend::updateOne(const std::string& collection, const Filter& filter,
                                    const UpdateSpec& update) {
    FilterMatcher::validate(filter);
    Document fields = UpdateApplier::assignments(update);

    auto docs = loadCollection(collection);
    for (auto& d : docs) {
        if (!FilterMatcher::matches(d, filter)) continue;

        UpdateResult result;
        result.matched_count = 1;
        if (UpdateApplier::apply(d, fields)) {
            result.modified_count = 1;
            saveCollection(collection, docs);
        }
        return result;
    }
    return UpdateResult{};
}

std::optional<Document> FileBackend::findOneAndUpdate(const std::string& collection, const Filter& filter,
                                                       const UpdateSpec& update, ReturnDocument which) {
    FilterMatcher::validate(filter);
    Document fields = UpdateApplier::assignments(update);

    auto docs = loadCollection(collection);
    for (auto& d : docs) {
        if (!FilterMatcher::matches(d, filter)) continue;

        Document before = d;
        if (UpdateApplier::apply(d, fields)) {
            saveCollection(collection, docs);
        }
        return which == ReturnDocument::BEFORE ? before : d;
    }
    return std::nullopt;
}

DeleteResult FileBackend::deleteOne(const std::string& collection, const Filter& filter) {
    FilterMatcher::validate(filter);

    auto docs = loadCollection(collection);
    auto it = std::find_if(docs.begin(), docs.end(),
                           [&](const Document& d) { return FilterMatcher::matches(d, filter); });
    if (it == docs.end()) {
        return DeleteResult{};
    }
    docs.erase(it);
    saveCollection(collection, docs);
    return DeleteResult{1};
}

DeleteResult FileBackend::deleteMany(const std::string& collection, const Filter& filter) {
    FilterMatcher::validate(filter);

    auto docs = loadCollection(collection);
    const auto before = docs.size();
    if (FilterMatcher::isEmpty(filter)) {
        docs.clear();
    } else {
        docs.erase(std::remove_if(docs.begin(), docs.end(),
                                  [&](const Document& d) { return FilterMatcher::matches(d, filter); }),
                   docs.end());
    }

    const auto deleted = static_cast<int64_t>(before - docs.size());
    if (deleted > 0) {
        saveCollection(collection, docs);
    }
    VESTA_DEBUG("FileBackend: deleted {} documents from {}", deleted, collection);
    return DeleteResult{deleted};
}

int64_t FileBackend::countDocuments(const std::string& collection, const Filter& filter) {
    return static_cast<int64_t>(FilterMatcher::apply(loadCollection(collection), filter).size());
}

std::vector<json> FileBackend::distinct(const std::string& collection, const std::string& field,
                                        const Filter& filter) {
    std::vector<json> values;
    for (const auto& d : FilterMatcher::apply(loadCollection(collection), filter)) {
        if (!d.is_object()) continue;
        auto it = d.find(field);
        if (it == d.end() || it->is_null()) continue;
        if (std::find(values.begin(), values.end(), *it) == values.end()) {
            values.push_back(*it);
        }
    }
    return values;
}

std::unique_ptr<query::Cursor> FileBackend::aggregate(const std::string& collection,
                                                      const query::Pipeline& pipeline) {
    validateCollectionName(collection);
    return std::make_unique<query::AggregationCursor>(pipeline, [this, collection]() {
        return loadCollection(collection);
    });
}

std::vector<Document> FileBackend::textSearch(const std::string& collection, const std::string& term,
                                              size_t limit) {
    std::vector<std::pair<Document, int>> scored;
    for (auto& d : loadCollection(collection)) {
        int score = textScore(d, term);
        if (score > 0) {
            scored.emplace_back(std::move(d), score);
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<Document> out;
    for (auto& entry : scored) {
        if (limit > 0 && out.size() >= limit) break;
        out.push_back(std::move(entry.first));
    }
    return out;
}

Filter FileBackend::nativeIdFilter(const std::string& id) const {
    return Filter{{"_id", id}};
}

void FileBackend::ensureIndexes(const std::string& collection, const std::vector<IndexSpec>& indexes) {
    validateCollectionName(collection);
    VESTA_DEBUG("FileBackend: ignoring {} index definitions for {}", indexes.size(), collection);
}

bool FileBackend::dropCollection(const std::string& collection) {
    const std::string path = collectionPath(collection);
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw StorageError(ErrorCode::IO_FAILURE, "cannot remove " + path + ": " + ec.message());
    }
    if (removed) {
        VESTA_INFO("FileBackend: dropped collection {}", collection);
    }
    return removed;
}

std::vector<std::string> FileBackend::listCollections() {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::exists(storage_dir_, ec)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(storage_dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        const auto& p = entry.path();
        if (p.extension() == ".json") {
            names.push_back(p.stem().string());
        }
    }
    if (ec) {
        throw StorageError(ErrorCode::IO_FAILURE, "cannot list " + storage_dir_ + ": " + ec.message());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace storage
} // namespace vesta
