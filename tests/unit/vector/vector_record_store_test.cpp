#include <gtest/gtest.h>
#include <vecstore/metadata/database.h>
#include <vecstore/vector/distance.h>
#include <vecstore/vector/table_identifier.h>
#include <vecstore/vector/vector_record_store.h>
#include <vecstore/vector/virtual_index_manager.h>

#include <cmath>
#include <limits>

using namespace vecstore;
using namespace vecstore::vector;

namespace {

std::vector<float> unit(size_t dim, size_t hot) {
    std::vector<float> v(dim, 0.0f);
    v[hot] = 1.0f;
    return v;
}

} // namespace

class VectorRecordStoreTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.open(":memory:", metadata::ConnectionMode::Memory).has_value());
        ASSERT_TRUE(registerDistanceFunctions(db_.handle()).has_value());
        auto caps = VirtualIndexManager::probeCapabilities(db_, GetParam());
        if (GetParam() && !caps.accelerated) {
            GTEST_SKIP() << "sqlite-vec unavailable: " << caps.detail;
        }
        manager_ = std::make_unique<VirtualIndexManager>(db_, caps);
        store_ = std::make_unique<VectorRecordStore>(db_, *manager_);
        ASSERT_TRUE(manager_->ensureTable(table_, 4).has_value());
    }

    metadata::Database db_;
    std::unique_ptr<VirtualIndexManager> manager_;
    std::unique_ptr<VectorRecordStore> store_;
    TableIdentifier table_ = TableIdentifier::forIndex("m1", 4);
};

TEST_P(VectorRecordStoreTest, NearestNeighbourScenario) {
    ASSERT_TRUE(store_->addVector(table_, 10, unit(4, 0), 4).has_value());
    ASSERT_TRUE(store_->addVector(table_, 11, unit(4, 1), 4).has_value());

    std::vector<float> query{0.9f, 0.1f, 0.0f, 0.0f};
    auto result = store_->search(table_, query, 1);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value().chunkIds[0], 10);
    EXPECT_NEAR(result.value().distances[0], 0.1414f, 1e-3f);
    EXPECT_EQ(result.value().indices[0], 0u);
}

TEST_P(VectorRecordStoreTest, InsertedVectorIsFoundAtDistanceZero) {
    std::vector<float> v{0.25f, -1.0f, 3.5f, 0.0f};
    ASSERT_TRUE(store_->addVector(table_, 42, v, 4).has_value());
    ASSERT_TRUE(store_->addVector(table_, 43, unit(4, 3), 4).has_value());

    auto result = store_->search(table_, v, 1);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value().chunkIds[0], 42);
    EXPECT_NEAR(result.value().distances[0], 0.0f, 1e-6f);
}

TEST_P(VectorRecordStoreTest, DimensionMismatchLeavesTableUntouched) {
    std::vector<float> wrong{1.0f, 2.0f, 3.0f};
    auto r = store_->addVector(table_, 1, wrong, 4);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);

    auto empty = store_->addVector(table_, 1, std::vector<float>{}, 4);
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);

    auto nan = store_->addVector(
        table_, 1, std::vector<float>{std::numeric_limits<float>::quiet_NaN(), 0, 0, 0}, 4);
    EXPECT_EQ(nan.error().code, ErrorCode::ValidationError);

    EXPECT_EQ(store_->count(table_).value(), 0u);
}

TEST_P(VectorRecordStoreTest, BatchIsAllOrNothing) {
    std::vector<VectorEntry> entries{{1, unit(4, 0)}, {2, {1.0f, 2.0f}}, {3, unit(4, 2)}};
    auto r = store_->addVectors(table_, entries, 4);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(store_->count(table_).value(), 0u);

    entries[1].embedding = unit(4, 1);
    auto ok = store_->addVectors(table_, entries, 4);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 3u);
    EXPECT_EQ(store_->chunkIds(table_).value(), (std::vector<int64_t>{1, 2, 3}));
}

TEST_P(VectorRecordStoreTest, DeleteRemovesEveryRowForChunk) {
    ASSERT_TRUE(store_->addVector(table_, 5, unit(4, 0), 4).has_value());
    ASSERT_TRUE(store_->addVector(table_, 5, unit(4, 1), 4).has_value());
    ASSERT_TRUE(store_->addVector(table_, 6, unit(4, 2), 4).has_value());

    auto removed = store_->deleteByChunkId(table_, 5);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed.value(), 2u);

    auto result = store_->search(table_, unit(4, 0), 10);
    ASSERT_TRUE(result.has_value());
    for (auto id : result.value().chunkIds) {
        EXPECT_NE(id, 5);
    }
    EXPECT_EQ(store_->deleteByChunkId(table_, 999).value(), 0u);
}

TEST_P(VectorRecordStoreTest, DeleteMany) {
    std::vector<VectorEntry> entries{{1, unit(4, 0)}, {2, unit(4, 1)}, {3, unit(4, 2)}};
    ASSERT_TRUE(store_->addVectors(table_, entries, 4).has_value());

    std::vector<int64_t> ids{1, 3};
    EXPECT_EQ(store_->deleteByChunkIds(table_, ids).value(), 2u);
    EXPECT_EQ(store_->chunkIds(table_).value(), (std::vector<int64_t>{2}));
}

TEST_P(VectorRecordStoreTest, KIsClampedAndResultsAreOrdered) {
    ASSERT_TRUE(store_->addVector(table_, 1, std::vector<float>{1, 0, 0, 0}, 4).has_value());
    ASSERT_TRUE(store_->addVector(table_, 2, std::vector<float>{2, 0, 0, 0}, 4).has_value());
    ASSERT_TRUE(store_->addVector(table_, 3, std::vector<float>{4, 0, 0, 0}, 4).has_value());

    auto result = store_->search(table_, std::vector<float>{0, 0, 0, 0}, 1000);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value().size(), 3u);
    for (size_t i = 1; i < result.value().size(); ++i) {
        EXPECT_LE(result.value().distances[i - 1], result.value().distances[i]);
        EXPECT_EQ(result.value().indices[i], i);
    }
    EXPECT_EQ(result.value().chunkIds.front(), 1);
    EXPECT_EQ(result.value().chunkIds.back(), 3);

    auto none = store_->search(table_, std::vector<float>{0, 0, 0, 0}, 0);
    ASSERT_TRUE(none.has_value());
    EXPECT_TRUE(none.value().empty());
}

TEST_P(VectorRecordStoreTest, ThresholdFiltersFarRows) {
    ASSERT_TRUE(store_->addVector(table_, 1, std::vector<float>{1, 0, 0, 0}, 4).has_value());
    ASSERT_TRUE(store_->addVector(table_, 2, std::vector<float>{3, 0, 0, 0}, 4).has_value());

    auto result = store_->search(table_, std::vector<float>{0, 0, 0, 0}, 10, 4, 1.5f);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value().chunkIds[0], 1);
}

TEST_P(VectorRecordStoreTest, QueryValidation) {
    ASSERT_TRUE(store_->addVector(table_, 1, unit(4, 0), 4).has_value());

    auto empty = store_->search(table_, std::vector<float>{}, 5);
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);

    auto wrongDim = store_->search(table_, std::vector<float>{1, 0}, 5);
    EXPECT_EQ(wrongDim.error().code, ErrorCode::ValidationError);

    auto explicitDim = store_->search(table_, unit(4, 0), 5, 8);
    EXPECT_EQ(explicitDim.error().code, ErrorCode::ValidationError);
}

TEST_P(VectorRecordStoreTest, MissingTableIsEmpty) {
    auto other = TableIdentifier::forIndex("never", 4);
    EXPECT_EQ(store_->count(other).value(), 0u);
    EXPECT_TRUE(store_->chunkIds(other).value().empty());
    EXPECT_EQ(store_->deleteByChunkId(other, 1).value(), 0u);

    auto result = store_->search(other, unit(4, 0), 3);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
    EXPECT_FALSE(manager_->tableExists(other));

    auto add = store_->addVector(other, 1, unit(4, 0), 4);
    EXPECT_EQ(add.error().code, ErrorCode::NotFound);
}

TEST_P(VectorRecordStoreTest, EmptyTableSearch) {
    auto result = store_->search(table_, unit(4, 0), 5);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
}

TEST_P(VectorRecordStoreTest, KAboveVec0LimitUsesScan) {
    const size_t rows = kMaxAcceleratedK + 4;
    std::vector<VectorEntry> entries;
    entries.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        float x = static_cast<float>(i);
        entries.push_back(VectorEntry{static_cast<int64_t>(i), {x, 0.0f, 0.0f, 0.0f}});
    }
    ASSERT_EQ(store_->addVectors(table_, entries, 4).value(), rows);

    std::vector<float> query{0.0f, 0.0f, 0.0f, 0.0f};
    auto result = store_->search(table_, query, kMaxAcceleratedK + 100);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result.value().size(), rows);
    EXPECT_EQ(result.value().chunkIds.front(), 0);
    EXPECT_EQ(result.value().chunkIds.back(), static_cast<int64_t>(rows - 1));
}

INSTANTIATE_TEST_SUITE_P(AcceleratedOnOff, VectorRecordStoreTest, ::testing::Bool(),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? "Accelerated" : "BruteForce";
                         });

TEST(ChunkIdTest, Normalize) {
    EXPECT_EQ(normalizeChunkId(10.0).value(), 10);
    EXPECT_EQ(normalizeChunkId(-3.0).value(), -3);
    EXPECT_EQ(normalizeChunkId(7.9).value(), 7);
    EXPECT_EQ(normalizeChunkId(std::nan("")).error().code, ErrorCode::ValidationError);
    EXPECT_EQ(normalizeChunkId(std::numeric_limits<double>::infinity()).error().code,
              ErrorCode::ValidationError);
    EXPECT_EQ(normalizeChunkId(1e300).error().code, ErrorCode::ValidationError);
}

TEST(SearchPathTest, Vec0OnlyWithinKLimit) {
    EXPECT_EQ(chooseSearchPath(true, TableKind::Accelerated, 1), SearchPath::Accelerated);
    EXPECT_EQ(chooseSearchPath(true, TableKind::Accelerated, kMaxAcceleratedK),
              SearchPath::Accelerated);
    EXPECT_EQ(chooseSearchPath(true, TableKind::Accelerated, kMaxAcceleratedK + 1),
              SearchPath::BruteForce);
    EXPECT_EQ(chooseSearchPath(false, TableKind::Accelerated, 5), SearchPath::BruteForce);
    EXPECT_EQ(chooseSearchPath(true, TableKind::Plain, 5), SearchPath::BruteForce);
}

TEST(VectorRecordStoreModuleTest, Vec0TableWithoutModuleReadsEmptyAndRejectsWrites) {
    metadata::Database db;
    ASSERT_TRUE(db.open(":memory:", metadata::ConnectionMode::Memory).has_value());
    ASSERT_TRUE(registerDistanceFunctions(db.handle()).has_value());
    auto caps = VirtualIndexManager::probeCapabilities(db, true);
    if (!caps.accelerated) {
        GTEST_SKIP() << "sqlite-vec unavailable: " << caps.detail;
    }

    auto table = TableIdentifier::forIndex("m1", 4);
    VirtualIndexManager creator(db, caps);
    ASSERT_TRUE(creator.ensureTable(table, 4).has_value());
    VectorRecordStore writer(db, creator);
    ASSERT_TRUE(writer.addVector(table, 1, unit(4, 0), 4).has_value());

    // Same file reopened with acceleration turned off
    VirtualIndexManager manager(db, BackendCapabilities{false, "disabled"});
    ASSERT_EQ(manager.tableKind(table).value(), TableKind::Accelerated);
    VectorRecordStore store(db, manager);

    auto count = store.count(table);
    ASSERT_TRUE(count.has_value()) << count.error().message;
    EXPECT_EQ(count.value(), 0u);

    auto ids = store.chunkIds(table);
    ASSERT_TRUE(ids.has_value());
    EXPECT_TRUE(ids.value().empty());

    auto result = store.search(table, unit(4, 0), 3);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result.value().empty());

    auto write = store.addVector(table, 2, unit(4, 1), 4);
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error().code, ErrorCode::SchemaError);

    const int64_t gone[] = {1};
    auto removed = store.deleteByChunkIds(table, gone);
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code, ErrorCode::SchemaError);

    // Rows are intact for a connection with the module
    EXPECT_EQ(writer.count(table).value(), 1u);
}
