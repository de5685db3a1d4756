#include <gtest/gtest.h>
#include <vecstore/metadata/database.h>
#include <vecstore/vector/metadata_catalog.h>

#include "../../support/temp_dir_scope.h"

#include <thread>

using namespace vecstore;
using namespace vecstore::vector;

class MetadataCatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.open(":memory:", metadata::ConnectionMode::Memory).has_value());
        catalog_ = std::make_unique<MetadataCatalog>(db_);
        ASSERT_TRUE(catalog_->initializeSchema().has_value());
    }

    metadata::Database db_;
    std::unique_ptr<MetadataCatalog> catalog_;
};

TEST_F(MetadataCatalogTest, GetOrCreateIsIdempotent) {
    auto first = catalog_->getOrCreateMetadata("m1", 4);
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(first.value().modelName, "m1");
    EXPECT_EQ(first.value().dimension, 4u);
    EXPECT_EQ(first.value().totalVectors, 0);
    EXPECT_FALSE(first.value().documentId.has_value());
    EXPECT_TRUE(TableIdentifier::isValid(first.value().tableIdentifier));

    auto second = catalog_->getOrCreateMetadata("m1", 4);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value().id, first.value().id);
    EXPECT_EQ(second.value().tableIdentifier, first.value().tableIdentifier);

    auto all = catalog_->listAll();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all.value().size(), 1u);
}

TEST_F(MetadataCatalogTest, DocumentScopedRowsAreSeparate) {
    MetadataOptions docA;
    docA.documentId = 1;
    MetadataOptions docB;
    docB.documentId = 2;

    auto corpus = catalog_->getOrCreateMetadata("m1", 4);
    auto a = catalog_->getOrCreateMetadata("m1", 4, docA);
    auto b = catalog_->getOrCreateMetadata("m1", 4, docB);
    ASSERT_TRUE(corpus.has_value() && a.has_value() && b.has_value());

    EXPECT_NE(corpus.value().tableIdentifier, a.value().tableIdentifier);
    EXPECT_NE(a.value().tableIdentifier, b.value().tableIdentifier);
    EXPECT_EQ(a.value().documentId, std::optional<int64_t>(1));

    auto found = catalog_->findByModelAndDimension("m1", 4, 2);
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->id, b.value().id);
}

TEST_F(MetadataCatalogTest, ReverseLookupByTableIdentifier) {
    auto meta = catalog_->getOrCreateMetadata("m1", 8);
    ASSERT_TRUE(meta.has_value());

    auto found = catalog_->findByTableIdentifier(meta.value().tableIdentifier);
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found.value().has_value());
    EXPECT_EQ(found.value()->modelName, "m1");

    auto missing = catalog_->findByTableIdentifier("vec_nothing");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(MetadataCatalogTest, ExplicitTableName) {
    MetadataOptions opts;
    opts.tableName = "custom_table";
    auto meta = catalog_->getOrCreateMetadata("m1", 4, opts);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta.value().tableIdentifier, "custom_table");

    MetadataOptions bad;
    bad.tableName = "x; DROP TABLE vector_index_metadata";
    auto rejected = catalog_->getOrCreateMetadata("m1", 4, bad);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::ValidationError);
}

TEST_F(MetadataCatalogTest, RejectsInvalidKeys) {
    EXPECT_EQ(catalog_->getOrCreateMetadata("", 4).error().code, ErrorCode::ValidationError);
    EXPECT_EQ(catalog_->getOrCreateMetadata("m", 0).error().code, ErrorCode::ValidationError);
}

TEST_F(MetadataCatalogTest, CounterBookkeeping) {
    auto meta = catalog_->getOrCreateMetadata("m1", 4).value();
    ASSERT_TRUE(catalog_->incrementVectorCount(meta.id, 5).has_value());
    ASSERT_TRUE(catalog_->incrementVectorCount(meta.id, -2).has_value());
    EXPECT_EQ(catalog_->findById(meta.id).value()->totalVectors, 3);

    // Never negative
    ASSERT_TRUE(catalog_->incrementVectorCount(meta.id, -10).has_value());
    EXPECT_EQ(catalog_->findById(meta.id).value()->totalVectors, 0);
}

TEST_F(MetadataCatalogTest, DeleteMetadata) {
    auto meta = catalog_->getOrCreateMetadata("m1", 4).value();
    ASSERT_TRUE(catalog_->deleteMetadata(meta.id).has_value());
    EXPECT_FALSE(catalog_->findById(meta.id).value().has_value());

    // Deleting again is harmless
    EXPECT_TRUE(catalog_->deleteMetadata(meta.id).has_value());
}

TEST(MetadataCatalogConcurrencyTest, ConcurrentCreatorsShareOneRow) {
    auto tmp = test_support::TempDirScope::unique_under("vecstore-catalog");
    auto path = (tmp.path() / "catalog.db").string();

    {
        metadata::Database setup;
        ASSERT_TRUE(setup.open(path, metadata::ConnectionMode::Create).has_value());
        ASSERT_TRUE(setup.enableWAL().has_value());
        ASSERT_TRUE(MetadataCatalog(setup).initializeSchema().has_value());
    }

    constexpr int kThreads = 4;
    std::vector<int64_t> ids(kThreads, -1);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            metadata::Database db;
            if (!db.open(path, metadata::ConnectionMode::ReadWrite))
                return;
            MetadataCatalog catalog(db);
            auto meta = catalog.getOrCreateMetadata("shared", 16);
            if (meta)
                ids[i] = meta.value().id;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < kThreads; ++i) {
        EXPECT_EQ(ids[i], ids[0]) << "thread " << i;
    }
    EXPECT_NE(ids[0], -1);
}
