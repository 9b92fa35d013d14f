// Example: Opening storage and working with countries
//
// Usage: vesta_quickstart [config.yaml]
// Environment: MONGODB_URL, DATABASE_NAME, VESTA_STORAGE_MODE, VESTA_STORAGE_DIR, VESTA_LOG_LEVEL

#include "content/country_repository.h"
#include "storage/storage_bootstrap.h"
#include "storage/storage_error.h"
#include "utils/logger.h"
#include "utils/storage_config.h"
#include <iostream>

using namespace vesta;

int main(int argc, char** argv) {
    utils::StorageConfig config;
    try {
        if (argc > 1) {
            config = utils::StorageConfig::loadFromYaml(argv[1]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }
    config.applyEnvironment();

    utils::Logger::init(config.logging.file, utils::Logger::levelFromString(config.logging.level));
    VESTA_INFO("Storage configuration: {}", config.toJson().dump());

    try {
        // 1. Select and open the backend (network first in auto mode)
        auto storage = storage::StorageBootstrap::open(config);
        std::cout << "Using backend: " << storage->backendName() << "\n\n";

        content::CountryRepository countries(*storage);
        countries.ensureIndexes();

        // 2. Create a country unless it already exists
        if (!countries.getById("japan")) {
            countries.create(Document{
                {"slug", "japan"},
                {"name", "Japan"},
                {"region", "Asia"},
                {"summary", "Visa-free entry for short stays for many nationalities"},
                {"published", true}
            });
        }

        // 3. Replace an embedded list
        countries.replaceVisaTypes("japan", nlohmann::ordered_json::array({
            {{"name", "Tourist"}, {"fees", nlohmann::ordered_json::array({{{"amount", 0}}})}}
        }));

        // 4. Query
        content::ListOptions options;
        options.published = true;
        options.sort = "name";
        for (const auto& c : countries.getAll(options)) {
            std::cout << c["id"].get<std::string>() << ": " << c.value("name", "") << "\n";
        }

        // 5. Count by region
        auto rows = storage->aggregate(content::CountryRepository::COLLECTION,
                                       query::Pipeline().groupBy("region"))->toList();
        std::cout << "\nCountries per region:\n";
        for (const auto& row : rows) {
            std::cout << "  " << row["id"].dump() << " -> " << row["count"] << "\n";
        }

        storage->close();
    } catch (const storage::StorageError& e) {
        VESTA_CRITICAL("Storage failure: {}", e.what());
        utils::Logger::shutdown();
        return 2;
    }

    utils::Logger::shutdown();
    return 0;
}
