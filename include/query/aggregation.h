#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "query/cursor.h"
#include "storage/document.h"

namespace vesta {
namespace query {

/**
 * @brief Typed aggregation pipeline
 *
 * Supported stages mirror the MongoDB subset the callers use:
 *   {"$match": {...}}
 *   {"$group": {"_id": null | "$field", "<name>": {"$sum": 1}}}
 *   {"$sort": {"<field>": 1 | -1}}
 *
 * Any other stage kind is kept as PassThroughStage and is a no-op when
 * evaluated in memory (a warning is logged). The network backend forwards
 * such stages to the server unchanged.
 */
struct MatchStage {
    Filter filter;
};

enum class AccumulatorKind { COUNT };

struct Accumulator {
    std::string name = "count";
    AccumulatorKind kind = AccumulatorKind::COUNT;
};

struct GroupStage {
    /// Field to group by; std::nullopt groups everything into one row.
    std::optional<std::string> field;
    /// Output id when grouping everything (null unless a constant was given)
    nlohmann::ordered_json constant_id = nullptr;
    std::vector<Accumulator> accumulators{Accumulator{}};
};

struct SortStage {
    SortSpec sort;
};

struct PassThroughStage {
    std::string name;            // e.g. "$project"
    nlohmann::ordered_json spec; // the full stage object
};

using PipelineStage = std::variant<MatchStage, GroupStage, SortStage, PassThroughStage>;

class Pipeline {
public:
    Pipeline() = default;

    // Builder API
    Pipeline& match(Filter filter);
    Pipeline& groupAll(const std::string& count_name = "count");
    Pipeline& groupBy(const std::string& field, const std::string& count_name = "count");
    Pipeline& sortBy(const std::string& field, SortDirection direction = SortDirection::ASCENDING);
    Pipeline& add(PipelineStage stage);

    /// Parse MongoDB-style stage array.
    /// @throws storage::StorageError (UNSUPPORTED_QUERY) for malformed stages
    ///         or accumulators other than {"$sum": 1}
    static Pipeline fromJson(const nlohmann::ordered_json& stages);

    /// MongoDB-style stage array (output rows of $group use "_id")
    nlohmann::ordered_json toJson() const;

    const std::vector<PipelineStage>& stages() const { return stages_; }
    bool empty() const { return stages_.empty(); }
    size_t size() const { return stages_.size(); }

private:
    std::vector<PipelineStage> stages_;
};

class AggregationEngine {
public:
    /// Evaluate every stage in order over one snapshot. Group rows carry their key in "_id".
    static std::vector<Document> run(std::vector<Document> snapshot, const Pipeline& pipeline);

    static std::vector<Document> applyStage(std::vector<Document> rows, const PipelineStage& stage);

private:
    static std::vector<Document> applyGroup(const std::vector<Document>& rows, const GroupStage& group);
};

/// Cursor over an in-memory pipeline; a chained sort/skip/limit applies to the pipeline output.
class AggregationCursor : public Cursor {
public:
    AggregationCursor(Pipeline pipeline, SnapshotCursor::Loader loader);

    const Pipeline& pipeline() const { return pipeline_; }

protected:
    std::vector<Document> fetch(const CursorState& state, std::optional<size_t> length) override;

private:
    Pipeline pipeline_;
    SnapshotCursor::Loader loader_;
};

} // namespace query
} // namespace vesta
