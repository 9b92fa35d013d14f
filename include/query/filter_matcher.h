#pragma once

#include <optional>
#include <string>
#include <vector>

#include "storage/document.h"

namespace vesta {
namespace query {

/**
 * Evaluates the closed filter grammar used by the file backend:
 * top-level field equality (AND-ed) plus the reserved "$text" key.
 *
 * Anything else ($or, $in, {"$gt": ...}, ...) is rejected by validate()
 * with StorageError(UNSUPPORTED_QUERY).
 */
class FilterMatcher {
public:
    static constexpr const char* TEXT_KEY = "$text";

    /// Fields searched by "$text"
    static const std::vector<std::string>& textFields();

    /// @throws storage::StorageError (UNSUPPORTED_QUERY) on any construct outside the grammar
    static void validate(const Filter& filter);

    /// Match a single document. The filter is expected to be validated.
    /// A null filter or empty object matches everything.
    static bool matches(const Document& doc, const Filter& filter);

    /// validate() once, then keep matching documents in their original order
    static std::vector<Document> apply(const std::vector<Document>& docs, const Filter& filter);

    /// Search term of a "$text" entry: either "term" or {"$search": "term"}
    static std::optional<std::string> textTerm(const Filter& filter);

    static bool isEmpty(const Filter& filter) {
        return filter.is_null() || (filter.is_object() && filter.empty());
    }
};

} // namespace query
} // namespace vesta
