#include <gtest/gtest.h>
#include "storage/identity_normalizer.h"
#include "utils/id_generator.h"

using namespace vesta;
using namespace vesta::storage;
using json = nlohmann::ordered_json;

class IdentityNormalizerTest : public ::testing::Test {
protected:
    IdentityNormalizer countries_{CollectionProfile{{"id", "slug"}, {"visa_types", "documents"}}};
    IdentityNormalizer plain_;
};

TEST_F(IdentityNormalizerTest, SlugWinsOverNativeId) {
    Document doc{{"_id", {{"$oid", "65a1f0c2e4b0a1b2c3d4e5f6"}}}, {"slug", "japan"}, {"name", "Japan"}};
    countries_.normalize(doc);
    EXPECT_EQ(doc["id"], "japan");
    EXPECT_FALSE(doc.contains("_id"));
}

TEST_F(IdentityNormalizerTest, ExistingIdIsKept) {
    Document doc{{"_id", "native"}, {"id", "kenya"}, {"slug", "kenya-ke"}};
    countries_.normalize(doc);
    EXPECT_EQ(doc["id"], "kenya");
    EXPECT_FALSE(doc.contains("_id"));
}

TEST_F(IdentityNormalizerTest, ObjectIdFallbackIsUnwrapped) {
    Document doc{{"_id", {{"$oid", "65a1f0c2e4b0a1b2c3d4e5f6"}}}, {"name", "Peru"}};
    plain_.normalize(doc);
    EXPECT_EQ(doc["id"], "65a1f0c2e4b0a1b2c3d4e5f6");
    EXPECT_FALSE(doc.contains("_id"));
}

TEST_F(IdentityNormalizerTest, EmptySlugFallsThrough) {
    Document doc{{"_id", "uuid-1"}, {"id", ""}, {"slug", ""}};
    countries_.normalize(doc);
    EXPECT_EQ(doc["id"], "uuid-1");
}

TEST_F(IdentityNormalizerTest, SequenceFieldsDefaultToEmpty) {
    Document doc{{"id", "chile"}, {"visa_types", nullptr}};
    countries_.normalize(doc);
    EXPECT_EQ(doc["visa_types"], json::array());
    EXPECT_EQ(doc["documents"], json::array());
    EXPECT_FALSE(doc.contains("processing_times"));
}

TEST_F(IdentityNormalizerTest, NormalizeIsIdempotent) {
    Document doc{{"_id", {{"$oid", "65a1f0c2e4b0a1b2c3d4e5f6"}}}, {"slug", "japan"}, {"documents", {"passport"}}};
    countries_.normalize(doc);
    Document once = doc;
    countries_.normalize(doc);
    EXPECT_EQ(doc, once);
}

TEST_F(IdentityNormalizerTest, GroupRowIdentity) {
    Document row{{"_id", nullptr}, {"count", 4}};
    plain_.normalizeIdentity(row);
    EXPECT_TRUE(row.contains("id"));
    EXPECT_TRUE(row["id"].is_null());
    EXPECT_FALSE(row.contains("_id"));
    EXPECT_FALSE(row.contains("visa_types"));
}

TEST_F(IdentityNormalizerTest, GroupKeyBecomesIdInPlace) {
    Document row{{"_id", "Asia"}, {"count", 3}};
    plain_.normalizeIdentity(row);
    EXPECT_EQ(row, (json{{"id", "Asia"}, {"count", 3}}));
}

TEST_F(IdentityNormalizerTest, AssignIdentityPrefersSlug) {
    Document with_slug{{"slug", "japan"}};
    EXPECT_EQ(countries_.assignIdentity(with_slug), "japan");
    EXPECT_EQ(with_slug["id"], "japan");

    Document bare{{"name", "Nowhere"}};
    std::string id = countries_.assignIdentity(bare);
    EXPECT_TRUE(utils::IdGenerator::isUuid(id));
    EXPECT_EQ(bare["id"], id);
}

TEST(IdGeneratorTest, UuidsAreVersion4AndUnique) {
    std::string a = utils::IdGenerator::uuid4();
    std::string b = utils::IdGenerator::uuid4();
    EXPECT_TRUE(utils::IdGenerator::isUuid(a));
    EXPECT_NE(a, b);
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(std::string("89ab").find(a[19]), std::string::npos);

    EXPECT_TRUE(utils::IdGenerator::isObjectIdHex("65a1f0c2e4b0a1b2c3d4e5f6"));
    EXPECT_FALSE(utils::IdGenerator::isObjectIdHex("japan"));
}
