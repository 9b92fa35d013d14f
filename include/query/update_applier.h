#pragma once

#include "storage/document.h"

namespace vesta {
namespace query {

/**
 * Shallow field-level update.
 *
 * An update is either a plain field map or {"$set": {...}}. Each named
 * top-level field is assigned wholesale: sequences and nested mappings
 * are replaced, never merged element-wise. Unnamed fields are untouched,
 * so applying the same update twice equals applying it once.
 */
class UpdateApplier {
public:
    /// Extract the field assignments of an update.
    /// @throws storage::StorageError (UNSUPPORTED_QUERY) for other operators
    ///         ($inc, $unset, $push, ...) or any attempt to change "_id"
    static Document assignments(const UpdateSpec& update);

    /// Apply assignments in place; returns true if any value changed.
    static bool apply(Document& doc, const Document& assignments);

    /// Canonical {"$set": {...}} form for drivers that require operators
    static UpdateSpec toSetOperator(const UpdateSpec& update);
};

} // namespace query
} // namespace vesta
