#include "query/filter_matcher.h"
#include "storage/storage_error.h"

namespace vesta {
namespace query {

using storage::ErrorCode;
using storage::StorageError;
using json = nlohmann::ordered_json;

namespace {

std::optional<std::string> termOf(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_object() && v.size() == 1 && v.contains("$search") && v["$search"].is_string()) {
        return v["$search"].get<std::string>();
    }
    return std::nullopt;
}

bool hasOperatorKey(const json& v) {
    if (!v.is_object()) return false;
    for (auto it = v.begin(); it != v.end(); ++it) {
        if (!it.key().empty() && it.key()[0] == '$') return true;
    }
    return false;
}

} // namespace

const std::vector<std::string>& FilterMatcher::textFields() {
    static const std::vector<std::string> fields{"name", "summary"};
    return fields;
}

void FilterMatcher::validate(const Filter& filter) {
    if (filter.is_null()) return;
    if (!filter.is_object()) {
        throw StorageError(ErrorCode::UNSUPPORTED_QUERY,
            "filter must be an object, got " + std::string(filter.type_name()));
    }
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        const std::string& key = it.key();
        if (key == TEXT_KEY) {
            if (!termOf(it.value())) {
                throw StorageError(ErrorCode::UNSUPPORTED_QUERY,
                    "$text expects a string or {\"$search\": string}");
            }
            continue;
        }
        if (!key.empty() && key[0] == '$') {
            throw StorageError(ErrorCode::UNSUPPORTED_QUERY, "operator '" + key + "' is not supported");
        }
        if (hasOperatorKey(it.value())) {
            throw StorageError(ErrorCode::UNSUPPORTED_QUERY,
                "operator expression on field '" + key + "' is not supported: " + it.value().dump());
        }
    }
}

bool FilterMatcher::matches(const Document& doc, const Filter& filter) {
    if (isEmpty(filter)) return true;
    if (!doc.is_object()) return false;

    for (auto it = filter.begin(); it != filter.end(); ++it) {
        if (it.key() == TEXT_KEY) {
            auto term = termOf(it.value());
            if (!term) return false;
            bool found = false;
            for (const auto& field : textFields()) {
                auto f = doc.find(field);
                if (f != doc.end() && f->is_string() &&
                    containsIgnoreCase(f->get_ref<const std::string&>(), *term)) {
                    found = true;
                    break;
                }
            }
            if (!found) return false;
            continue;
        }

        auto f = doc.find(it.key());
        if (f == doc.end() || *f != it.value()) {
            return false;
        }
    }
    return true;
}

std::vector<Document> FilterMatcher::apply(const std::vector<Document>& docs, const Filter& filter) {
    validate(filter);
    if (isEmpty(filter)) return docs;

    std::vector<Document> out;
    for (const auto& d : docs) {
        if (matches(d, filter)) out.push_back(d);
    }
    return out;
}

std::optional<std::string> FilterMatcher::textTerm(const Filter& filter) {
    if (!filter.is_object()) return std::nullopt;
    auto it = filter.find(TEXT_KEY);
    if (it == filter.end()) return std::nullopt;
    return termOf(*it);
}

} // namespace query
} // namespace vesta
