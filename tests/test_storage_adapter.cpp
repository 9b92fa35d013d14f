#include <gtest/gtest.h>
#include "storage/file_backend.h"
#include "storage/storage_adapter.h"
#include "storage/storage_error.h"
#include "utils/id_generator.h"

#include <filesystem>
#include <set>

namespace fs = std::filesystem;
using namespace vesta;
using namespace vesta::storage;
using json = nlohmann::ordered_json;

class StorageAdapterTest : public ::testing::Test {
protected:
    std::string test_path_ = "./test_storage_adapter";
    std::unique_ptr<StorageAdapter> adapter_;

    void SetUp() override {
        if (fs::exists(test_path_)) {
            fs::remove_all(test_path_);
        }
        adapter_ = std::make_unique<StorageAdapter>(std::make_unique<FileBackend>(test_path_));
        adapter_->open();
        adapter_->registerCollection("countries", CollectionProfile{{"id", "slug"}, {"visa_types", "documents"}});
    }

    void TearDown() override {
        adapter_.reset();
        if (fs::exists(test_path_)) {
            fs::remove_all(test_path_);
        }
    }
};

TEST_F(StorageAdapterTest, OperationsRequireOpen) {
    StorageAdapter closed(std::make_unique<FileBackend>(test_path_));
    EXPECT_FALSE(closed.isOpen());
    try {
        closed.findOne("countries", Filter::object());
        FAIL() << "expected NotConnected";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NOT_CONNECTED);
    }

    adapter_->close();
    EXPECT_FALSE(adapter_->isOpen());
    EXPECT_THROW(adapter_->countDocuments("countries"), StorageError);
    EXPECT_THROW(adapter_->insertOne("countries", Document{{"name", "x"}}), StorageError);

    adapter_->open();
    EXPECT_EQ(adapter_->countDocuments("countries"), 0);
}

TEST_F(StorageAdapterTest, InsertAssignsExternalIdAndRoundTrips) {
    auto result = adapter_->insertOne("countries", Document{{"name", "Nowhere"}});
    EXPECT_TRUE(utils::IdGenerator::isUuid(result.id));

    auto found = adapter_->findOne("countries", Filter{{"id", result.id}});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ((*found)["name"], "Nowhere");
    EXPECT_FALSE(found->contains("_id"));
}

TEST_F(StorageAdapterTest, SlugBecomesExternalId) {
    auto result = adapter_->insertOne("countries", Document{{"slug", "japan"}, {"name", "Japan"}});
    EXPECT_EQ(result.id, "japan");
    auto found = adapter_->findById("countries", "japan");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ((*found)["id"], "japan");
}

TEST_F(StorageAdapterTest, FindByIdFallsBackToNativeId) {
    // A legacy record written without an external id
    FileBackend raw(test_path_);
    raw.open();
    raw.saveCollection("countries", {Document{{"_id", "legacy-1"}, {"name", "Legacy"}}});

    auto found = adapter_->findById("countries", "legacy-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ((*found)["id"], "legacy-1");
    EXPECT_EQ((*found)["name"], "Legacy");
    EXPECT_FALSE(adapter_->findById("countries", "missing").has_value());
}

TEST_F(StorageAdapterTest, EveryReturnedDocumentIsNormalized) {
    adapter_->insertOne("countries", Document{{"slug", "peru"}, {"name", "Peru"}, {"region", "Americas"}});
    adapter_->insertOne("countries", Document{{"slug", "chile"}, {"name", "Chile"}, {"region", "Americas"}});

    auto check = [](const Document& d) {
        EXPECT_TRUE(d.contains("id"));
        EXPECT_FALSE(d.contains("_id"));
        EXPECT_TRUE(d["visa_types"].is_array());
        EXPECT_TRUE(d["documents"].is_array());
    };

    for (const auto& d : adapter_->find("countries")->toList()) check(d);
    for (const auto& d : adapter_->textSearch("countries", "pe")) check(d);
    check(*adapter_->findOne("countries", Filter{{"slug", "chile"}}));
    check(*adapter_->findOneAndUpdate("countries", Filter{{"id", "chile"}}, UpdateSpec{{"featured", true}}));
}

TEST_F(StorageAdapterTest, FindAppliesPagination) {
    for (const char* name : {"Chile", "Argentina", "Peru", "Bolivia"}) {
        adapter_->insertOne("countries", Document{{"name", name}});
    }
    auto docs = adapter_->find("countries", Filter::object(), 1, 2, SortSpec{"name"})->toList();
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(docs[0]["name"], "Bolivia");
    EXPECT_EQ(docs[1]["name"], "Chile");
}

TEST_F(StorageAdapterTest, AggregateRowsUseIdAndNoSequenceDefaults) {
    adapter_->insertOne("countries", Document{{"region", "Asia"}});
    adapter_->insertOne("countries", Document{{"region", "Asia"}});

    auto rows = adapter_->aggregate("countries", query::Pipeline().groupBy("region"))->toList();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (json{{"id", "Asia"}, {"count", 2}}));
}

TEST_F(StorageAdapterTest, GroupKeySortsBeforeIdentityRename) {
    for (const char* region : {"Y", "X", "Z", "X"}) {
        adapter_->insertOne("countries", Document{{"region", region}});
    }
    auto pipeline = query::Pipeline::fromJson(json::array({
        json{{"$group", {{"_id", "$region"}, {"count", {{"$sum", 1}}}}}},
        json{{"$sort", {{"_id", 1}}}},
    }));
    auto rows = adapter_->aggregate("countries", pipeline)->toList();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], (json{{"id", "X"}, {"count", 2}}));
    EXPECT_EQ(rows[1]["id"], "Y");
    EXPECT_EQ(rows[2]["id"], "Z");

    auto cursor = adapter_->aggregate("countries", query::Pipeline().groupBy("region"));
    cursor->sort("_id", SortDirection::DESCENDING);
    EXPECT_EQ(cursor->toList().front()["id"], "Z");
}

TEST_F(StorageAdapterTest, DistinctPublishedRegionsIgnoreInsertionOrder) {
    const std::vector<Document> countries = {
        Document{{"slug", "a"}, {"region", "X"}, {"published", true}},
        Document{{"slug", "b"}, {"region", "X"}, {"published", true}},
        Document{{"slug", "c"}, {"region", "Y"}, {"published", true}},
    };
    const std::set<std::string> expected{"X", "Y"};

    for (const auto& order : {std::vector<size_t>{0, 1, 2}, std::vector<size_t>{2, 1, 0},
                              std::vector<size_t>{1, 2, 0}}) {
        adapter_->deleteMany("countries", Filter::object());
        for (size_t i : order) {
            adapter_->insertOne("countries", countries[i]);
        }
        adapter_->insertOne("countries", Document{{"slug", "d"}, {"region", "Z"}, {"published", false}});

        auto values = adapter_->distinct("countries", "region", Filter{{"published", true}});
        EXPECT_EQ(values.size(), 2u);
        std::set<std::string> regions;
        for (const auto& v : values) regions.insert(v.get<std::string>());
        EXPECT_EQ(regions, expected);
    }
}

TEST_F(StorageAdapterTest, DistinctAndDeletes) {
    adapter_->insertOne("countries", Document{{"region", "Asia"}});
    adapter_->insertOne("countries", Document{{"region", "Europe"}});

    EXPECT_EQ(adapter_->distinct("countries", "region").size(), 2u);
    EXPECT_EQ(adapter_->deleteOne("countries", Filter{{"region", "Asia"}}).deleted_count, 1);
    EXPECT_EQ(adapter_->deleteMany("countries", Filter::object()).deleted_count, 1);
    EXPECT_EQ(adapter_->countDocuments("countries"), 0);
}

TEST_F(StorageAdapterTest, UnregisteredCollectionUsesDefaultProfile) {
    adapter_->insertOne("admins", Document{{"username", "root"}});
    auto admin = adapter_->findOne("admins", Filter{{"username", "root"}});
    ASSERT_TRUE(admin.has_value());
    EXPECT_TRUE(admin->contains("id"));
    EXPECT_FALSE(admin->contains("visa_types"));
}

TEST_F(StorageAdapterTest, BackendIdentity) {
    EXPECT_EQ(adapter_->backendName(), "file");
    EXPECT_EQ(adapter_->backendType(), BackendType::FILE);
}
