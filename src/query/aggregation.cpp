#include "query/aggregation.h"
#include "query/filter_matcher.h"
#include "storage/storage_error.h"
#include "utils/logger.h"

#include <algorithm>

namespace vesta {
namespace query {

using storage::ErrorCode;
using storage::StorageError;
using json = nlohmann::ordered_json;

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

bool isCountAccumulator(const json& spec) {
    if (!spec.is_object() || spec.size() != 1) return false;
    auto it = spec.find("$sum");
    return it != spec.end() && it->is_number() && it->get<double>() == 1.0;
}

GroupStage parseGroup(const json& body) {
    if (!body.is_object() || !body.contains("_id")) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "$group requires an _id key: " + body.dump());
    }

    GroupStage group;
    group.accumulators.clear();

    const json& id = body["_id"];
    if (id.is_string() && !id.get_ref<const std::string&>().empty() && id.get_ref<const std::string&>()[0] == '$') {
        group.field = id.get<std::string>().substr(1);
    } else if (id.is_object() || id.is_array()) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "compound $group keys are not supported: " + id.dump());
    } else {
        group.constant_id = id;
    }

    for (auto it = body.begin(); it != body.end(); ++it) {
        if (it.key() == "_id") continue;
        if (!isCountAccumulator(it.value())) {
            throw StorageError(ErrorCode::UNSUPPORTED_QUERY,
                "only {\"$sum\": 1} accumulators are supported, got '" + it.key() + "': " + it.value().dump());
        }
        group.accumulators.push_back(Accumulator{it.key(), AccumulatorKind::COUNT});
    }
    return group;
}

SortStage parseSort(const json& body) {
    if (!body.is_object() || body.size() != 1) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY,
            "$sort expects exactly one {field: 1|-1} entry: " + body.dump());
    }
    const json& dir = body.begin().value();
    if (!dir.is_number() || (dir.get<double>() != 1.0 && dir.get<double>() != -1.0)) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY,
            "$sort direction must be 1 or -1: " + body.dump());
    }
    return SortStage{SortSpec{body.begin().key(), SortSpec::directionFromInt(dir.get<int64_t>())}};
}

} // namespace

Pipeline& Pipeline::match(Filter filter) {
    stages_.emplace_back(MatchStage{std::move(filter)});
    return *this;
}

Pipeline& Pipeline::groupAll(const std::string& count_name) {
    GroupStage g;
    g.accumulators = {Accumulator{count_name, AccumulatorKind::COUNT}};
    stages_.emplace_back(std::move(g));
    return *this;
}

Pipeline& Pipeline::groupBy(const std::string& field, const std::string& count_name) {
    GroupStage g;
    g.field = field;
    g.accumulators = {Accumulator{count_name, AccumulatorKind::COUNT}};
    stages_.emplace_back(std::move(g));
    return *this;
}

Pipeline& Pipeline::sortBy(const std::string& field, SortDirection direction) {
    stages_.emplace_back(SortStage{SortSpec{field, direction}});
    return *this;
}

Pipeline& Pipeline::add(PipelineStage stage) {
    stages_.push_back(std::move(stage));
    return *this;
}

Pipeline Pipeline::fromJson(const json& stages) {
    if (!stages.is_array()) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "pipeline must be an array of stages");
    }

    Pipeline p;
    for (const auto& stage : stages) {
        if (!stage.is_object() || stage.size() != 1) {
            throw StorageError(ErrorCode::UNSUPPORTED_QUERY,
                "each pipeline stage must be an object with exactly one key: " + stage.dump());
        }
        const std::string& kind = stage.begin().key();
        const json& body = stage.begin().value();

        if (kind == "$match") {
            p.match(body);
        } else if (kind == "$group") {
            p.add(parseGroup(body));
        } else if (kind == "$sort") {
            p.add(parseSort(body));
        } else {
            p.add(PassThroughStage{kind, stage});
        }
    }
    return p;
}

json Pipeline::toJson() const {
    json out = json::array();
    for (const auto& stage : stages_) {
        std::visit(Overloaded{
            [&](const MatchStage& m) {
                out.push_back({{"$match", m.filter.is_null() ? json::object() : m.filter}});
            },
            [&](const GroupStage& g) {
                json body = json::object();
                body["_id"] = g.field ? json("$" + *g.field) : g.constant_id;
                for (const auto& acc : g.accumulators) {
                    body[acc.name] = {{"$sum", 1}};
                }
                out.push_back({{"$group", body}});
            },
            [&](const SortStage& s) {
                out.push_back({{"$sort", {{s.sort.field, s.sort.asInt()}}}});
            },
            [&](const PassThroughStage& pt) {
                out.push_back(pt.spec);
            }
        }, stage);
    }
    return out;
}

std::vector<Document> AggregationEngine::run(std::vector<Document> snapshot, const Pipeline& pipeline) {
    std::vector<Document> rows = std::move(snapshot);
    for (const auto& stage : pipeline.stages()) {
        rows = applyStage(std::move(rows), stage);
    }
    return rows;
}

std::vector<Document> AggregationEngine::applyStage(std::vector<Document> rows, const PipelineStage& stage) {
    return std::visit(Overloaded{
        [&](const MatchStage& m) {
            return FilterMatcher::apply(rows, m.filter);
        },
        [&](const GroupStage& g) {
            return applyGroup(rows, g);
        },
        [&](const SortStage& s) {
            sortDocuments(rows, s.sort, json(0));
            return std::move(rows);
        },
        [&](const PassThroughStage& pt) {
            VESTA_WARN("Aggregation stage '{}' is not supported in memory; passing {} rows through",
                pt.name, rows.size());
            return std::move(rows);
        }
    }, stage);
}

std::vector<Document> AggregationEngine::applyGroup(const std::vector<Document>& rows, const GroupStage& group) {
    auto makeRow = [&](const json& id, int64_t n) {
        Document row = Document::object();
        row["_id"] = id;
        for (const auto& acc : group.accumulators) {
            row[acc.name] = n;
        }
        return row;
    };

    if (!group.field) {
        return {makeRow(group.constant_id, static_cast<int64_t>(rows.size()))};
    }

    // Distinct keys in first-seen order
    std::vector<std::pair<json, int64_t>> buckets;
    for (const auto& r : rows) {
        json key = nullptr;
        if (r.is_object()) {
            auto it = r.find(*group.field);
            if (it != r.end()) key = *it;
        }
        auto b = std::find_if(buckets.begin(), buckets.end(),
                              [&](const auto& entry) { return entry.first == key; });
        if (b == buckets.end()) {
            buckets.emplace_back(std::move(key), 1);
        } else {
            ++b->second;
        }
    }

    std::vector<Document> out;
    out.reserve(buckets.size());
    for (const auto& [key, n] : buckets) {
        out.push_back(makeRow(key, n));
    }
    return out;
}

AggregationCursor::AggregationCursor(Pipeline pipeline, SnapshotCursor::Loader loader)
    : Cursor(Filter::object())
    , pipeline_(std::move(pipeline))
    , loader_(std::move(loader)) {}

std::vector<Document> AggregationCursor::fetch(const CursorState& state, std::optional<size_t> length) {
    auto rows = AggregationEngine::run(loader_(), pipeline_);
    return paginate(std::move(rows), state.sort, state.skip, state.limit, length);
}

} // namespace query
} // namespace vesta
