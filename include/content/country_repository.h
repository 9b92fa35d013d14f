#pragma once

#include <optional>
#include <string>
#include <vector>

#include "storage/storage_adapter.h"

namespace vesta {
namespace content {

/**
 * @brief Listing options for CountryRepository::getAll
 */
struct ListOptions {
    size_t skip = 0;
    size_t limit = 100;
    std::optional<bool> published;
    std::optional<std::string> region;
    std::optional<std::string> search;   // case-insensitive substring of name/summary
    std::optional<std::string> sort;     // field name, "-field" for descending
};

/**
 * @brief Country Repository
 *
 * CRUD over the "countries" collection. Countries embed their visa types,
 * documents, processing times and application methods as lists; those lists
 * are always replaced wholesale.
 *
 * Every document returned carries an "id" (slug or generated UUID) and
 * every embedded list, possibly empty.
 */
class CountryRepository {
public:
    static constexpr const char* COLLECTION = "countries";

    /// Fields update() accepts; everything else is ignored
    static const std::vector<std::string>& updatableFields();

    /// Normalization profile for the countries collection
    static storage::CollectionProfile profile();

    /// Registers the countries profile on the adapter
    explicit CountryRepository(storage::StorageAdapter& storage);

    /// Text index on name/summary and a lookup index on id
    void ensureIndexes();

    std::vector<Document> getAll(const ListOptions& options = {});
    std::optional<Document> getById(const std::string& id);
    std::vector<Document> search(const std::string& query);

    /**
     * @brief Insert a new country with defaults filled in
     * @throws std::invalid_argument if "name" is missing or the id/slug is taken
     */
    Document create(Document country);

    /// Partial update of the allowed fields; nulls are dropped
    std::optional<Document> update(const std::string& id, const Document& fields);

    bool remove(const std::string& id);

    std::optional<Document> replaceVisaTypes(const std::string& country_id, const nlohmann::ordered_json& items);
    std::optional<Document> replaceDocuments(const std::string& country_id, const nlohmann::ordered_json& items);
    std::optional<Document> replaceProcessingTimes(const std::string& country_id,
                                                   const nlohmann::ordered_json& items);
    std::optional<Document> replaceApplicationMethods(const std::string& country_id,
                                                      const nlohmann::ordered_json& items);

private:
    std::optional<Document> replaceList(const std::string& country_id, const std::string& field,
                                        nlohmann::ordered_json items);

    storage::StorageAdapter& storage_;
};

} // namespace content
} // namespace vesta
