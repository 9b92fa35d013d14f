#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace vesta {

/// A stored record: field order is preserved exactly as written.
using Document = nlohmann::ordered_json;

/// Equality predicate map, optionally with the reserved "$text" key.
using Filter = nlohmann::ordered_json;

/// Either a plain field map or {"$set": {...}}
using UpdateSpec = nlohmann::ordered_json;

enum class SortDirection { ASCENDING, DESCENDING };

struct SortSpec {
    std::string field;
    SortDirection direction = SortDirection::ASCENDING;

    /// Mongo-style numeric direction: 1 ascending, -1 descending
    int asInt() const { return direction == SortDirection::DESCENDING ? -1 : 1; }
    static SortDirection directionFromInt(int64_t d) {
        return d < 0 ? SortDirection::DESCENDING : SortDirection::ASCENDING;
    }
};

/// Which image findOneAndUpdate hands back
enum class ReturnDocument { BEFORE, AFTER };

struct InsertResult {
    std::string id;             // external id of the inserted document
};

struct UpdateResult {
    int64_t matched_count = 0;
    int64_t modified_count = 0;
};

struct DeleteResult {
    int64_t deleted_count = 0;
};

/// Index request; honoured by backends that maintain indexes, ignored by the file backend.
struct IndexSpec {
    std::vector<std::string> fields;
    bool unique = false;
    bool text = false;          // full-text index over all listed fields
};

// ===== Value ordering shared by cursors and aggregation =====

/// Type rank used when ordering values of different JSON types:
/// null < number < string < object < array < boolean
int typeRank(const nlohmann::ordered_json& v);

/// Three-way comparison (-1, 0, 1). Numbers compare numerically, strings
/// lexicographically by byte, arrays/objects by serialized form within their rank.
int compareValues(const nlohmann::ordered_json& a, const nlohmann::ordered_json& b);

/// Zero value of the given value's type ("" for strings, 0 for numbers, ...).
nlohmann::ordered_json zeroLike(const nlohmann::ordered_json& v);

/// Stable in-place sort of documents by one field.
/// Missing fields sort as `missing_default` when it is set, otherwise as
/// zeroLike() of the first present value of the field.
void sortDocuments(std::vector<Document>& docs, const SortSpec& sort,
                   const std::optional<nlohmann::ordered_json>& missing_default = std::nullopt);

/// Case-insensitive substring test (ASCII folding)
bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

} // namespace vesta
