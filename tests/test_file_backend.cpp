#include <gtest/gtest.h>
#include "storage/file_backend.h"
#include "storage/storage_error.h"
#include "utils/id_generator.h"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;
using namespace vesta;
using namespace vesta::storage;
using json = nlohmann::ordered_json;

class FileBackendTest : public ::testing::Test {
protected:
    std::string test_path_ = "./test_file_backend";
    std::unique_ptr<FileBackend> backend_;

    void SetUp() override {
        if (fs::exists(test_path_)) {
            fs::remove_all(test_path_);
        }
        backend_ = std::make_unique<FileBackend>(test_path_);
        backend_->open();
    }

    void TearDown() override {
        backend_.reset();
        if (fs::exists(test_path_)) {
            fs::remove_all(test_path_);
        }
    }

    void writeRaw(const std::string& collection, const std::string& content) {
        std::ofstream ofs(fs::path(test_path_) / (collection + ".json"));
        ofs << content;
    }
};

TEST_F(FileBackendTest, OpenCreatesDirectory) {
    EXPECT_TRUE(fs::is_directory(test_path_));
    EXPECT_TRUE(backend_->isOpen());
    EXPECT_EQ(backend_->name(), "file");
    EXPECT_EQ(backend_->type(), BackendType::FILE);
}

TEST_F(FileBackendTest, MissingCollectionIsEmpty) {
    EXPECT_FALSE(backend_->findOne("countries", Filter::object()).has_value());
    EXPECT_EQ(backend_->countDocuments("countries", Filter::object()), 0);
    EXPECT_TRUE(backend_->find("countries", Filter::object())->toList().empty());
    EXPECT_FALSE(fs::exists(fs::path(test_path_) / "countries.json"));
}

TEST_F(FileBackendTest, InsertThenFindRoundTrip) {
    Document doc{{"id", "japan"}, {"name", "Japan"}, {"visa_types", json::array()}};
    auto result = backend_->insertOne("countries", doc);
    EXPECT_TRUE(utils::IdGenerator::isUuid(result.id));

    auto found = backend_->findOne("countries", Filter{{"id", "japan"}});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ((*found)["name"], "Japan");
    EXPECT_EQ((*found)["_id"], result.id);

    // Field order survives the file round-trip
    auto it = found->begin();
    EXPECT_EQ(it.key(), "id");
    EXPECT_EQ((++it).key(), "name");
}

TEST_F(FileBackendTest, InsertKeepsExistingNativeId) {
    auto result = backend_->insertOne("countries", Document{{"_id", "fixed"}, {"name", "Peru"}});
    EXPECT_EQ(result.id, "fixed");
    EXPECT_TRUE(backend_->findOne("countries", backend_->nativeIdFilter("fixed")).has_value());
}

TEST_F(FileBackendTest, FileIsPrettyPrintedJsonArray) {
    backend_->insertOne("countries", Document{{"name", "Côte d'Ivoire"}});

    std::ifstream ifs(fs::path(test_path_) / "countries.json");
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("\n  {"), std::string::npos);
    EXPECT_NE(content.find("Côte d'Ivoire"), std::string::npos);
    EXPECT_TRUE(json::parse(content).is_array());
    EXPECT_FALSE(fs::exists(fs::path(test_path_) / "countries.json.tmp"));
}

TEST_F(FileBackendTest, UpdateIsIdempotent) {
    backend_->insertOne("countries", Document{{"id", "kenya"}, {"published", false}});

    auto first = backend_->updateOne("countries", Filter{{"id", "kenya"}}, UpdateSpec{{"$set", {{"published", true}}}});
    EXPECT_EQ(first.matched_count, 1);
    EXPECT_EQ(first.modified_count, 1);

    auto snapshot = backend_->findOne("countries", Filter{{"id", "kenya"}});

    auto second = backend_->updateOne("countries", Filter{{"id", "kenya"}}, UpdateSpec{{"$set", {{"published", true}}}});
    EXPECT_EQ(second.matched_count, 1);
    EXPECT_EQ(second.modified_count, 0);
    EXPECT_EQ(backend_->findOne("countries", Filter{{"id", "kenya"}}), snapshot);
}

TEST_F(FileBackendTest, UpdateTouchesOnlyFirstMatch) {
    backend_->insertOne("countries", Document{{"region", "Asia"}, {"n", 1}});
    backend_->insertOne("countries", Document{{"region", "Asia"}, {"n", 2}});

    backend_->updateOne("countries", Filter{{"region", "Asia"}}, UpdateSpec{{"featured", true}});
    EXPECT_EQ(backend_->countDocuments("countries", Filter{{"featured", true}}), 1);
    EXPECT_EQ(backend_->findOne("countries", Filter{{"featured", true}})->at("n"), 1);
}

TEST_F(FileBackendTest, UpdateWithoutMatch) {
    auto r = backend_->updateOne("countries", Filter{{"id", "atlantis"}}, UpdateSpec{{"name", "x"}});
    EXPECT_EQ(r.matched_count, 0);
    EXPECT_EQ(r.modified_count, 0);
}

TEST_F(FileBackendTest, FindOneAndUpdateReturnsRequestedImage) {
    backend_->insertOne("countries", Document{{"id", "peru"}, {"published", false}});

    auto after = backend_->findOneAndUpdate("countries", Filter{{"id", "peru"}},
                                            UpdateSpec{{"published", true}}, ReturnDocument::AFTER);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ((*after)["published"], true);

    auto before = backend_->findOneAndUpdate("countries", Filter{{"id", "peru"}},
                                             UpdateSpec{{"published", false}}, ReturnDocument::BEFORE);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ((*before)["published"], true);

    EXPECT_FALSE(backend_->findOneAndUpdate("countries", Filter{{"id", "none"}},
                                            UpdateSpec{{"published", true}}, ReturnDocument::AFTER));
}

TEST_F(FileBackendTest, DeleteManyAndCount) {
    for (int i = 0; i < 5; ++i) {
        backend_->insertOne("documents", Document{{"country_id", i % 2 == 0 ? "a" : "b"}, {"n", i}});
    }
    EXPECT_EQ(backend_->countDocuments("documents", Filter::object()), 5);

    auto deleted = backend_->deleteMany("documents", Filter{{"country_id", "a"}});
    EXPECT_EQ(deleted.deleted_count, 3);
    EXPECT_EQ(backend_->countDocuments("documents", Filter::object()), 2);
    EXPECT_EQ(backend_->countDocuments("documents", Filter{{"country_id", "a"}}), 0);

    EXPECT_EQ(backend_->deleteMany("documents", Filter::object()).deleted_count, 2);
    EXPECT_EQ(backend_->countDocuments("documents", Filter::object()), 0);
}

TEST_F(FileBackendTest, DeleteOneRemovesFirstMatch) {
    backend_->insertOne("countries", Document{{"region", "Asia"}, {"n", 1}});
    backend_->insertOne("countries", Document{{"region", "Asia"}, {"n", 2}});

    EXPECT_EQ(backend_->deleteOne("countries", Filter{{"region", "Asia"}}).deleted_count, 1);
    auto remaining = backend_->find("countries", Filter::object())->toList();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0]["n"], 2);
    EXPECT_EQ(backend_->deleteOne("countries", Filter{{"region", "Europe"}}).deleted_count, 0);
}

TEST_F(FileBackendTest, DistinctSkipsMissingAndNull) {
    backend_->insertOne("countries", Document{{"region", "Asia"}});
    backend_->insertOne("countries", Document{{"region", "Europe"}});
    backend_->insertOne("countries", Document{{"region", "Asia"}});
    backend_->insertOne("countries", Document{{"name", "no region"}});
    backend_->insertOne("countries", Document{{"region", nullptr}});

    auto values = backend_->distinct("countries", "region", Filter::object());
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[0], "Asia");
    EXPECT_EQ(values[1], "Europe");
}

TEST_F(FileBackendTest, CursorRereadsFileOnEachMaterialization) {
    auto cursor = backend_->find("countries", Filter::object());
    EXPECT_TRUE(cursor->toList().empty());
    backend_->insertOne("countries", Document{{"name", "Chile"}});
    EXPECT_EQ(cursor->toList().size(), 1u);
}

TEST_F(FileBackendTest, LaterWriterWins) {
    FileBackend other(test_path_);
    other.open();

    backend_->insertOne("countries", Document{{"id", "a"}});
    auto stale = other.loadCollection("countries");

    backend_->insertOne("countries", Document{{"id", "b"}});

    // A writer holding an older snapshot overwrites the newer file wholesale
    stale.push_back(Document{{"id", "c"}});
    other.saveCollection("countries", stale);

    auto ids = backend_->distinct("countries", "id", Filter::object());
    EXPECT_EQ(ids, (std::vector<json>{"a", "c"}));
}

TEST_F(FileBackendTest, CorruptFileRaisesIoFailure) {
    writeRaw("countries", "{ not json");
    try {
        backend_->findOne("countries", Filter::object());
        FAIL() << "expected IOFailure";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IO_FAILURE);
    }

    writeRaw("regions", "{\"name\": \"Asia\"}");
    EXPECT_THROW(backend_->countDocuments("regions", Filter::object()), StorageError);
}

TEST_F(FileBackendTest, BlankFileIsEmptyCollection) {
    writeRaw("countries", "  \n");
    EXPECT_EQ(backend_->countDocuments("countries", Filter::object()), 0);
}

TEST_F(FileBackendTest, UnsupportedConstructsAreRejected) {
    backend_->insertOne("countries", Document{{"n", 1}});

    auto expectCode = [](auto&& fn) {
        try {
            fn();
            FAIL() << "expected UnsupportedQuery";
        } catch (const StorageError& e) {
            EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_QUERY);
        }
    };

    expectCode([&] { backend_->findOne("countries", Filter{{"n", {{"$gt", 0}}}}); });
    expectCode([&] { backend_->find("countries", Filter{{"$or", json::array()}}); });
    expectCode([&] { backend_->updateOne("countries", Filter::object(), UpdateSpec{{"$inc", {{"n", 1}}}}); });
    expectCode([&] { backend_->countDocuments("countries", Filter{{"n", {{"$in", {1, 2}}}}}); });
    expectCode([&] { backend_->insertOne("countries", Document::array()); });
    expectCode([&] { backend_->findOne("../escape", Filter::object()); });
}

TEST_F(FileBackendTest, TextSearchRanksByField) {
    backend_->insertOne("countries", Document{{"name", "Other"}, {"summary", "Mentions Japan visa"}});
    backend_->insertOne("countries", Document{{"name", "Japan"}, {"summary", "Island nation"}});
    backend_->insertOne("countries", Document{{"name", "Chile"}, {"summary", "Andes"}});

    auto hits = backend_->textSearch("countries", "japan", 10);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0]["name"], "Japan");
    EXPECT_EQ(hits[1]["name"], "Other");

    EXPECT_EQ(backend_->textSearch("countries", "japan", 1).size(), 1u);
}

TEST_F(FileBackendTest, AggregateGroupsCollection) {
    backend_->insertOne("countries", Document{{"region", "Asia"}});
    backend_->insertOne("countries", Document{{"region", "Asia"}});
    backend_->insertOne("countries", Document{{"region", "Africa"}});

    auto rows = backend_->aggregate("countries", query::Pipeline().groupBy("region"))->toList();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["_id"], "Asia");
    EXPECT_EQ(rows[0]["count"], 2);
}

TEST_F(FileBackendTest, ListAndDropCollections) {
    backend_->insertOne("countries", Document{{"n", 1}});
    backend_->insertOne("admins", Document{{"n", 1}});
    backend_->ensureIndexes("countries", {IndexSpec{{"name"}, false, true}});

    EXPECT_EQ(backend_->listCollections(), (std::vector<std::string>{"admins", "countries"}));
    EXPECT_TRUE(backend_->dropCollection("admins"));
    EXPECT_FALSE(backend_->dropCollection("admins"));
    EXPECT_EQ(backend_->listCollections(), (std::vector<std::string>{"countries"}));
}
