#include "storage/identity_normalizer.h"
#include "utils/id_generator.h"

namespace vesta {
namespace storage {

using json = nlohmann::ordered_json;

namespace {

bool isNonEmptyId(const json& v) {
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    return v.is_number();
}

std::string idToString(const json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

} // namespace

IdentityNormalizer::IdentityNormalizer(CollectionProfile profile)
    : profile_(std::move(profile)) {}

std::optional<std::string> IdentityNormalizer::externalId(const Document& doc) const {
    if (!doc.is_object()) return std::nullopt;
    for (const auto& field : profile_.id_source_fields) {
        auto it = doc.find(field);
        if (it != doc.end() && isNonEmptyId(*it)) {
            return idToString(*it);
        }
    }
    return std::nullopt;
}

json IdentityNormalizer::unwrapNativeId(const json& native_id) {
    if (native_id.is_object() && native_id.size() == 1 && native_id.contains("$oid") &&
        native_id["$oid"].is_string()) {
        return native_id["$oid"];
    }
    return native_id;
}

std::string IdentityNormalizer::nativeIdToString(const json& native_id) {
    return idToString(unwrapNativeId(native_id));
}

void IdentityNormalizer::normalizeIdentity(Document& doc) const {
    if (!doc.is_object()) return;

    // Copy before assigning: writing "id" may reallocate the ordered map
    std::optional<json> external;
    for (const auto& field : profile_.id_source_fields) {
        auto it = doc.find(field);
        if (it != doc.end() && isNonEmptyId(*it)) {
            external = *it;
            break;
        }
    }
    if (!external) {
        auto native = doc.find(NATIVE_ID);
        if (native != doc.end()) {
            external = unwrapNativeId(*native);
        }
    }

    if (external && !doc.contains(EXTERNAL_ID) && doc.contains(NATIVE_ID)) {
        // Rename in place so the id keeps the native key's position
        Document renamed = Document::object();
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (it.key() == NATIVE_ID) {
                renamed[EXTERNAL_ID] = *external;
            } else {
                renamed[it.key()] = std::move(it.value());
            }
        }
        doc = std::move(renamed);
        return;
    }

    if (external) {
        doc[EXTERNAL_ID] = std::move(*external);
    }
    doc.erase(NATIVE_ID);
}

void IdentityNormalizer::normalize(Document& doc) const {
    if (!doc.is_object()) return;
    normalizeIdentity(doc);

    for (const auto& field : profile_.sequence_fields) {
        auto it = doc.find(field);
        if (it == doc.end() || it->is_null()) {
            doc[field] = json::array();
        }
    }
}

std::string IdentityNormalizer::assignIdentity(Document& doc) const {
    if (auto ext = externalId(doc)) {
        if (!doc.contains(EXTERNAL_ID) || !isNonEmptyId(doc[EXTERNAL_ID])) {
            doc[EXTERNAL_ID] = *ext;
        }
        return *ext;
    }
    std::string id = utils::IdGenerator::uuid4();
    doc[EXTERNAL_ID] = id;
    return id;
}

} // namespace storage
} // namespace vesta
