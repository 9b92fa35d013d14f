#include "query/cursor.h"
#include "query/filter_matcher.h"

namespace vesta {
namespace query {

Cursor::Cursor(Filter filter) {
    state_.filter = filter.is_null() ? Filter::object() : std::move(filter);
}

std::vector<Document> Cursor::toList(std::optional<size_t> length) {
    auto docs = fetch(state_, length);
    if (transform_) {
        for (auto& d : docs) transform_(d);
    }
    return docs;
}

std::vector<Document> paginate(std::vector<Document> docs,
                               const std::optional<SortSpec>& sort,
                               size_t skip, size_t limit,
                               std::optional<size_t> length) {
    if (sort && !sort->field.empty()) {
        sortDocuments(docs, *sort);
    }

    if (skip >= docs.size()) {
        return {};
    }

    size_t count = docs.size() - skip;
    if (limit > 0 && limit < count) count = limit;
    if (length && *length > 0 && *length < count) count = *length;

    auto first = docs.begin() + static_cast<std::ptrdiff_t>(skip);
    return std::vector<Document>(std::make_move_iterator(first),
                                 std::make_move_iterator(first + static_cast<std::ptrdiff_t>(count)));
}

std::vector<Document> applyCursorState(const std::vector<Document>& snapshot,
                                       const CursorState& state,
                                       std::optional<size_t> length) {
    return paginate(FilterMatcher::apply(snapshot, state.filter), state.sort, state.skip, state.limit, length);
}

SnapshotCursor::SnapshotCursor(Filter filter, Loader loader)
    : Cursor(std::move(filter))
    , loader_(std::move(loader)) {}

std::vector<Document> SnapshotCursor::fetch(const CursorState& state, std::optional<size_t> length) {
    return applyCursorState(loader_(), state, length);
}

} // namespace query
} // namespace vesta
