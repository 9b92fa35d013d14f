#pragma once

#include <optional>
#include <string>
#include <vector>

#include "storage/document.h"

namespace vesta {
namespace storage {

/// Per-collection normalization settings
struct CollectionProfile {
    /// Fields holding a domain id, in order of preference
    std::vector<std::string> id_source_fields{"id", "slug"};
    /// Embedded one-to-many lists that must always be present (as [])
    std::vector<std::string> sequence_fields;
};

/**
 * Reconciles backend-native identifiers ("_id", possibly an ObjectId
 * wrapper), domain slugs and generated ids into a single external "id".
 *
 * Precedence: first non-empty id source field, then the native "_id".
 * "_id" never survives normalization. normalize() is idempotent.
 */
class IdentityNormalizer {
public:
    static constexpr const char* EXTERNAL_ID = "id";
    static constexpr const char* NATIVE_ID = "_id";

    explicit IdentityNormalizer(CollectionProfile profile = {});

    /// Identity plus sequence-field defaults
    void normalize(Document& doc) const;

    /// Identity only (used for aggregation rows)
    void normalizeIdentity(Document& doc) const;

    /// External id of a document that is about to be inserted; generates a
    /// UUIDv4 and stores it in "id" when no id source field is set.
    std::string assignIdentity(Document& doc) const;

    /// Non-empty external id candidate of a document, if any
    std::optional<std::string> externalId(const Document& doc) const;

    /// Native id value with an {"$oid": "..."} wrapper replaced by its hex string
    static nlohmann::ordered_json unwrapNativeId(const nlohmann::ordered_json& native_id);

    /// String form of a native id value ({"$oid": "..."} unwraps to its hex)
    static std::string nativeIdToString(const nlohmann::ordered_json& native_id);

    const CollectionProfile& profile() const { return profile_; }

private:
    CollectionProfile profile_;
};

} // namespace storage
} // namespace vesta
