#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "storage/document.h"

namespace vesta {
namespace query {

/// Deferred query descriptor. limit == 0 means unbounded.
struct CursorState {
    Filter filter = Filter::object();
    size_t skip = 0;
    size_t limit = 0;
    std::optional<SortSpec> sort;
};

/**
 * Chainable, lazily materialized query.
 *
 * skip/limit/sort only record state (last call wins per axis); nothing is
 * read until toList(). Materialization order is fixed:
 * filter -> sort -> skip -> limit -> length cap.
 *
 * A cursor borrows the backend that created it; the backend must outlive it.
 */
class Cursor {
public:
    using Transform = std::function<void(Document&)>;

    virtual ~Cursor() = default;

    Cursor(const Cursor&) = delete;
    Cursor& operator=(const Cursor&) = delete;

    Cursor& skip(size_t n) { state_.skip = n; return *this; }
    Cursor& limit(size_t n) { state_.limit = n; return *this; }
    Cursor& sort(std::string field, SortDirection direction = SortDirection::ASCENDING) {
        state_.sort = SortSpec{std::move(field), direction};
        return *this;
    }
    Cursor& sort(const SortSpec& spec) { state_.sort = spec; return *this; }

    const CursorState& state() const { return state_; }

    /// Per-document post-processing applied to every materialized row
    /// (the storage adapter installs identity normalization here).
    void setTransform(Transform fn) { transform_ = std::move(fn); }

    /// Execute the query. `length` additionally caps the number of rows.
    std::vector<Document> toList(std::optional<size_t> length = std::nullopt);

protected:
    explicit Cursor(Filter filter);

    virtual std::vector<Document> fetch(const CursorState& state, std::optional<size_t> length) = 0;

    CursorState state_;

private:
    Transform transform_;
};

/// Apply sort -> skip -> limit -> length to an already filtered sequence.
std::vector<Document> paginate(std::vector<Document> docs,
                               const std::optional<SortSpec>& sort,
                               size_t skip, size_t limit,
                               std::optional<size_t> length = std::nullopt);

/// Full in-memory cursor pipeline over a snapshot (validates the filter).
std::vector<Document> applyCursorState(const std::vector<Document>& snapshot,
                                       const CursorState& state,
                                       std::optional<size_t> length = std::nullopt);

/**
 * Cursor over a snapshot produced by `loader` on every toList() call;
 * used by the file backend so each materialization re-reads the collection.
 */
class SnapshotCursor : public Cursor {
public:
    using Loader = std::function<std::vector<Document>()>;

    SnapshotCursor(Filter filter, Loader loader);

protected:
    std::vector<Document> fetch(const CursorState& state, std::optional<size_t> length) override;

private:
    Loader loader_;
};

} // namespace query
} // namespace vesta
