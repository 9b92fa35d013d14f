#include "query/update_applier.h"
#include "storage/storage_error.h"

namespace vesta {
namespace query {

using storage::ErrorCode;
using storage::StorageError;

Document UpdateApplier::assignments(const UpdateSpec& update) {
    if (!update.is_object()) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "update must be an object");
    }

    Document fields = Document::object();
    for (auto it = update.begin(); it != update.end(); ++it) {
        const std::string& key = it.key();
        if (key == "$set") {
            if (!it.value().is_object()) {
                throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "$set expects an object");
            }
            for (auto f = it.value().begin(); f != it.value().end(); ++f) {
                fields[f.key()] = f.value();
            }
        } else if (!key.empty() && key[0] == '$') {
            throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "update operator '" + key + "' is not supported");
        } else {
            fields[key] = it.value();
        }
    }

    if (fields.contains("_id")) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "field '_id' is immutable");
    }
    return fields;
}

bool UpdateApplier::apply(Document& doc, const Document& assignments) {
    bool modified = false;
    for (auto it = assignments.begin(); it != assignments.end(); ++it) {
        auto cur = doc.find(it.key());
        if (cur != doc.end() && *cur == it.value()) continue;
        doc[it.key()] = it.value();
        modified = true;
    }
    return modified;
}

UpdateSpec UpdateApplier::toSetOperator(const UpdateSpec& update) {
    return UpdateSpec{{"$set", assignments(update)}};
}

} // namespace query
} // namespace vesta
