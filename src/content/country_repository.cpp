#include "content/country_repository.h"
#include "utils/logger.h"
#include "utils/time_utils.h"

#include <algorithm>
#include <stdexcept>

namespace vesta {
namespace content {

using json = nlohmann::ordered_json;

namespace {

const std::vector<std::string> kSequenceFields = {
    "visa_types", "documents", "processing_times", "application_methods",
    "embassies", "important_notes"
};

void stripKeys(json& item, std::initializer_list<const char*> keys) {
    if (!item.is_object()) return;
    for (const char* k : keys) {
        item.erase(k);
    }
}

bool nonEmptyString(const Document& doc, const char* field) {
    auto it = doc.find(field);
    return it != doc.end() && it->is_string() && !it->get<std::string>().empty();
}

} // namespace

const std::vector<std::string>& CountryRepository::updatableFields() {
    static const std::vector<std::string> fields = {
        "name", "flag", "region", "visa_required", "last_updated", "summary",
        "published", "featured", "photo_requirements", "embassies",
        "important_notes", "hero_image_url"
    };
    return fields;
}

storage::CollectionProfile CountryRepository::profile() {
    storage::CollectionProfile p;
    p.id_source_fields = {"id", "slug"};
    p.sequence_fields = kSequenceFields;
    return p;
}

CountryRepository::CountryRepository(storage::StorageAdapter& storage)
    : storage_(storage) {
    storage_.registerCollection(COLLECTION, profile());
}

void CountryRepository::ensureIndexes() {
    IndexSpec text_index;
    text_index.fields = {"name", "summary"};
    text_index.text = true;

    IndexSpec id_index;
    id_index.fields = {"id"};

    storage_.ensureIndexes(COLLECTION, {text_index, id_index});
}

std::vector<Document> CountryRepository::getAll(const ListOptions& options) {
    Filter filter = Filter::object();
    if (options.published) {
        filter["published"] = *options.published;
    }
    if (options.region && !options.region->empty()) {
        filter["region"] = *options.region;
    }
    if (options.search && !options.search->empty()) {
        filter["$text"] = *options.search;
    }

    std::optional<SortSpec> sort;
    if (options.sort && !options.sort->empty()) {
        const std::string& s = *options.sort;
        if (s[0] == '-') {
            sort = SortSpec{s.substr(1), SortDirection::DESCENDING};
        } else {
            sort = SortSpec{s, SortDirection::ASCENDING};
        }
    }

    return storage_.find(COLLECTION, filter, options.skip, options.limit, sort)->toList();
}

std::optional<Document> CountryRepository::getById(const std::string& id) {
    return storage_.findById(COLLECTION, id);
}

std::vector<Document> CountryRepository::search(const std::string& query) {
    return storage_.textSearch(COLLECTION, query, 10);
}

Document CountryRepository::create(Document country) {
    if (!country.is_object() || !nonEmptyString(country, "name")) {
        throw std::invalid_argument("country requires a name");
    }

    if (nonEmptyString(country, "slug") &&
        storage_.findOne(COLLECTION, Filter{{"slug", country["slug"]}})) {
        throw std::invalid_argument("country slug already exists: " + country["slug"].get<std::string>());
    }
    if (nonEmptyString(country, "id") && storage_.findById(COLLECTION, country["id"].get<std::string>())) {
        throw std::invalid_argument("country id already exists: " + country["id"].get<std::string>());
    }

    if (!country.contains("published") || country["published"].is_null()) country["published"] = false;
    if (!country.contains("featured") || country["featured"].is_null()) country["featured"] = false;
    if (!country.contains("photo_requirements") || country["photo_requirements"].is_null()) {
        country["photo_requirements"] = json::object();
    }
    for (const auto& field : kSequenceFields) {
        if (!country.contains(field) || country[field].is_null()) {
            country[field] = json::array();
        }
    }

    const std::string now = utils::nowIso8601();
    country["created_at"] = now;
    country["updated_at"] = now;

    auto result = storage_.insertOne(COLLECTION, country);
    VESTA_INFO("Created country {}", result.id);

    if (auto stored = storage_.findById(COLLECTION, result.id)) {
        return *stored;
    }
    country["id"] = result.id;
    storage_.normalizerFor(COLLECTION).normalize(country);
    return country;
}

std::optional<Document> CountryRepository::update(const std::string& id, const Document& fields) {
    Document assignments = Document::object();
    if (fields.is_object()) {
        const auto& allowed = updatableFields();
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            if (it->is_null()) continue;
            if (std::find(allowed.begin(), allowed.end(), it.key()) == allowed.end()) {
                VESTA_DEBUG("Ignoring non-updatable country field {}", it.key());
                continue;
            }
            assignments[it.key()] = *it;
        }
    }

    if (assignments.empty()) {
        return getById(id);
    }
    assignments["updated_at"] = utils::nowIso8601();

    return storage_.findOneAndUpdate(COLLECTION, Filter{{"id", id}}, Document{{"$set", assignments}});
}

bool CountryRepository::remove(const std::string& id) {
    auto result = storage_.deleteOne(COLLECTION, Filter{{"id", id}});
    if (result.deleted_count > 0) {
        VESTA_INFO("Deleted country {}", id);
        return true;
    }
    return false;
}

std::optional<Document> CountryRepository::replaceList(const std::string& country_id, const std::string& field,
                                                       json items) {
    if (!items.is_array()) {
        throw std::invalid_argument(field + " must be a list");
    }
    for (auto& item : items) {
        stripKeys(item, {"id", "country_id"});
    }

    Document assignments{{field, std::move(items)}};
    assignments["updated_at"] = utils::nowIso8601();
    return storage_.findOneAndUpdate(COLLECTION, Filter{{"id", country_id}}, Document{{"$set", assignments}});
}

std::optional<Document> CountryRepository::replaceVisaTypes(const std::string& country_id, const json& items) {
    json cleaned = items;
    if (cleaned.is_array()) {
        for (auto& visa_type : cleaned) {
            if (!visa_type.is_object()) continue;
            auto fees = visa_type.find("fees");
            if (fees == visa_type.end() || !fees->is_array()) continue;
            for (auto& fee : *fees) {
                stripKeys(fee, {"id", "visa_type_id"});
            }
        }
    }
    return replaceList(country_id, "visa_types", std::move(cleaned));
}

std::optional<Document> CountryRepository::replaceDocuments(const std::string& country_id, const json& items) {
    return replaceList(country_id, "documents", items);
}

std::optional<Document> CountryRepository::replaceProcessingTimes(const std::string& country_id,
                                                                  const json& items) {
    return replaceList(country_id, "processing_times", items);
}

std::optional<Document> CountryRepository::replaceApplicationMethods(const std::string& country_id,
                                                                     const json& items) {
    return replaceList(country_id, "application_methods", items);
}

} // namespace content
} // namespace vesta
