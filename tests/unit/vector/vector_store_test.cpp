#include <gtest/gtest.h>
#include <vecstore/vector/vector_store.h>

#include "../../support/temp_dir_scope.h"

#include <limits>

using namespace vecstore;
using namespace vecstore::vector;

namespace {

EmbeddingRecord makeRecord(int64_t chunkId, int64_t documentId, std::vector<float> embedding,
                           std::string model = "m1") {
    EmbeddingRecord rec;
    rec.chunkId = chunkId;
    rec.documentId = documentId;
    rec.model = std::move(model);
    rec.dimensions = embedding.size();
    rec.embedding = std::move(embedding);
    return rec;
}

} // namespace

class VectorStoreTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        config::VectorStoreConfig cfg;
        cfg.base_path = tmp_.path() / "index";
        cfg.backend = GetParam();
        store_ = std::make_unique<VectorStore>(cfg);
        ASSERT_TRUE(store_->initialize().has_value());
    }

    bool sqlite() const { return GetParam() == "sqlite-vec"; }

    test_support::TempDirScope tmp_ = test_support::TempDirScope::unique_under("vecstore-store");
    std::unique_ptr<VectorStore> store_;
};

TEST_P(VectorStoreTest, StoreThenSearch) {
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(10, 1, {1, 0, 0, 0})).has_value());
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(11, 1, {0, 1, 0, 0})).has_value());

    ASSERT_TRUE(store_->currentModel().has_value());
    EXPECT_EQ(store_->currentModel()->name, "m1");
    EXPECT_EQ(store_->currentModel()->dimensions, 4u);

    auto result = store_->search({0.9f, 0.1f, 0.0f, 0.0f}, 1, std::string("m1"), 4);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value().chunkIds[0], 10);
    EXPECT_NEAR(result.value().distances[0], 0.1414f, 1e-3f);

    // Defaults to the current model
    auto implicit = store_->search({0.9f, 0.1f, 0.0f, 0.0f}, 5);
    ASSERT_TRUE(implicit.has_value());
    EXPECT_EQ(implicit.value().chunkIds, (std::vector<int64_t>{10, 11}));
}

TEST_P(VectorStoreTest, DocumentSearchIsIsolated) {
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(1, 100, {1, 0, 0})).has_value());
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(2, 200, {1, 0, 0})).has_value());

    auto doc = store_->searchDocument({1, 0, 0}, 100, 10);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc.value().chunkIds, (std::vector<int64_t>{1}));

    auto corpus = store_->search({1, 0, 0}, 10);
    ASSERT_TRUE(corpus.has_value());
    EXPECT_EQ(corpus.value().size(), 2u);

    EXPECT_TRUE(store_->documentIndexExists(100, "m1", 3));
    EXPECT_FALSE(store_->documentIndexExists(300, "m1", 3));
}

TEST_P(VectorStoreTest, NeverIndexedModelReturnsEmpty) {
    auto result = store_->search({1, 0, 0, 0}, 5, std::string("unknown"), 4);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());

    auto doc = store_->searchDocument({1, 0, 0, 0}, 9, 5, std::string("unknown"), 4);
    ASSERT_TRUE(doc.has_value());
    EXPECT_TRUE(doc.value().empty());

    if (sqlite()) {
        auto path = store_->config().base_path / "models" / "index_unknown_4.db";
        EXPECT_FALSE(std::filesystem::exists(path));
        EXPECT_FALSE(std::filesystem::exists(store_->documentIndexPath(9, "unknown", 4)));
    }

    // Nothing stored and no model given
    auto bare = store_->search({1, 0, 0, 0}, 5);
    ASSERT_TRUE(bare.has_value());
    EXPECT_TRUE(bare.value().empty());
}

TEST_P(VectorStoreTest, DimensionMismatchIsRejected) {
    auto bad = makeRecord(1, 1, {1, 0, 0});
    bad.dimensions = 4;
    auto r = store_->storeEmbedding(bad);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    EXPECT_FALSE(store_->documentIndexExists(1, "m1", 4));

    ASSERT_TRUE(store_->storeEmbedding(makeRecord(1, 1, {1, 0, 0, 0})).has_value());
    auto query = store_->search({1, 0}, 5, std::string("m1"), 4);
    ASSERT_FALSE(query.has_value());
    EXPECT_EQ(query.error().code, ErrorCode::ValidationError);
}

TEST_P(VectorStoreTest, BatchValidatesBeforeWriting) {
    std::vector<EmbeddingRecord> records{makeRecord(1, 1, {1, 0}), makeRecord(2, 1, {0})};
    records[1].dimensions = 2;
    auto r = store_->storeEmbeddings(records);
    ASSERT_FALSE(r.has_value());
    EXPECT_FALSE(store_->documentIndexExists(1, "m1", 2));

    records[1].embedding = {0, 1};
    records.push_back(makeRecord(3, 2, {1, 1}));
    auto ok = store_->storeEmbeddings(records);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 3u);
    EXPECT_EQ(store_->search({1, 0}, 10, std::string("m1"), 2).value().size(), 3u);
}

TEST_P(VectorStoreTest, NonFiniteEmbeddingIsRejected) {
    auto nan = makeRecord(1, 1, {std::numeric_limits<float>::quiet_NaN(), 0, 0});
    auto r = store_->storeEmbedding(nan);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    EXPECT_FALSE(store_->documentIndexExists(1, "m1", 3));

    std::vector<EmbeddingRecord> records{
        makeRecord(2, 1, {1, 0, 0}),
        makeRecord(3, 1, {0, std::numeric_limits<float>::infinity(), 0})};
    EXPECT_EQ(store_->storeEmbeddings(records).error().code, ErrorCode::ValidationError);
    EXPECT_FALSE(store_->documentIndexExists(1, "m1", 3));

    ASSERT_TRUE(store_->storeEmbedding(makeRecord(4, 1, {1, 0, 0})).has_value());
    auto query = store_->search({std::numeric_limits<float>::quiet_NaN(), 0, 0}, 1,
                                std::string("m1"), 3);
    ASSERT_FALSE(query.has_value());
    EXPECT_EQ(query.error().code, ErrorCode::ValidationError);
}

TEST_P(VectorStoreTest, DeleteDocumentPropagatesToModelIndex) {
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(1, 100, {1, 0, 0})).has_value());
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(2, 100, {0, 1, 0})).has_value());
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(3, 200, {0, 0, 1})).has_value());

    ASSERT_TRUE(store_->deleteDocumentIndex(100).has_value());
    EXPECT_FALSE(store_->documentIndexExists(100, "m1", 3));
    if (sqlite()) {
        EXPECT_FALSE(std::filesystem::exists(store_->documentIndexPath(100, "m1", 3)));
    }

    auto corpus = store_->search({1, 0, 0}, 10);
    ASSERT_TRUE(corpus.has_value());
    EXPECT_EQ(corpus.value().chunkIds, (std::vector<int64_t>{3}));

    auto doc = store_->searchDocument({1, 0, 0}, 100, 10);
    ASSERT_TRUE(doc.has_value());
    EXPECT_TRUE(doc.value().empty());

    // Unknown document is a no-op
    EXPECT_TRUE(store_->deleteDocumentIndex(999).has_value());
}

TEST_P(VectorStoreTest, StatsAndMaintenance) {
    auto empty = store_->getIndexStats();
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty.value().totalVectors, 0u);
    EXPECT_FALSE(empty.value().isInitialized);

    EXPECT_EQ(store_->saveIndex().error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(store_->createIndex("m2", 2).has_value());
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(1, 1, {1, 0}, "m2")).has_value());
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(2, 1, {0, 1}, "m2")).has_value());

    auto stats = store_->getIndexStats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().totalVectors, 2u);
    EXPECT_EQ(stats.value().dimension, 2u);
    EXPECT_EQ(stats.value().currentModel, "m2");

    EXPECT_TRUE(store_->saveIndex().has_value());
    EXPECT_TRUE(store_->optimizeIndex().has_value());
    ASSERT_TRUE(store_->resetIndex().has_value());
    EXPECT_EQ(store_->getIndexStats().value().totalVectors, 0u);
}

TEST_P(VectorStoreTest, PoolReusesInstances) {
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(1, 1, {1, 0})).has_value());
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(2, 1, {0, 1})).has_value());

    auto stats = store_->poolStats();
    EXPECT_EQ(stats.size, 2u); // document index + model index
    EXPECT_EQ(stats.misses, 2u);
    EXPECT_GE(stats.hits, 2u);
}

TEST_P(VectorStoreTest, DeleteModelIndex) {
    ASSERT_TRUE(store_->storeEmbedding(makeRecord(1, 1, {1, 0})).has_value());
    ASSERT_TRUE(store_->deleteModelIndex("m1", 2).has_value());
    if (sqlite()) {
        EXPECT_FALSE(std::filesystem::exists(store_->config().base_path / "models" /
                                             "index_m1_2.db"));
    }
    auto result = store_->search({1, 0}, 5, std::string("m1"), 2);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
}

INSTANTIATE_TEST_SUITE_P(Backends, VectorStoreTest, ::testing::Values("sqlite-vec", "memory"),
                         [](const ::testing::TestParamInfo<std::string>& info) {
                             return info.param == "memory" ? std::string("Memory")
                                                           : std::string("Sqlite");
                         });

TEST(VectorStoreLifecycleTest, RequiresInitialize) {
    auto tmp = test_support::TempDirScope::unique_under("vecstore-lifecycle");
    config::VectorStoreConfig cfg;
    cfg.base_path = tmp.path();
    VectorStore store(cfg);
    EXPECT_FALSE(store.isInitialized());

    auto r = store.storeEmbedding(makeRecord(1, 1, {1, 0}));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotInitialized);
}

TEST(VectorStoreLifecycleTest, RejectsUnknownBackend) {
    config::VectorStoreConfig cfg;
    cfg.backend = "faiss";
    VectorStore store(cfg);
    EXPECT_FALSE(store.initialize().has_value());
}

TEST(VectorStoreLifecycleTest, SharedPoolAcrossStores) {
    auto tmp = test_support::TempDirScope::unique_under("vecstore-shared");
    config::VectorStoreConfig cfg;
    cfg.base_path = tmp.path();
    auto pool = std::make_shared<InstancePool>();

    VectorStore writer(cfg, pool);
    ASSERT_TRUE(writer.initialize().has_value());
    ASSERT_TRUE(writer.storeEmbedding(makeRecord(5, 1, {0, 1})).has_value());

    VectorStore reader(cfg, pool);
    ASSERT_TRUE(reader.initialize().has_value());
    auto result = reader.search({0, 1}, 1, std::string("m1"), 2);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value().chunkIds[0], 5);
}

TEST(VectorStoreLifecycleTest, MemoryBackendRejectsBoundedPool) {
    config::VectorStoreConfig cfg;
    cfg.backend = "memory";
    cfg.max_pool_size = 1;
    VectorStore store(cfg);
    auto r = store.initialize();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
}

TEST(VectorStoreLifecycleTest, BoundedSharedPoolKeepsMemoryIndices) {
    auto tmp = test_support::TempDirScope::unique_under("vecstore-bounded");
    config::VectorStoreConfig cfg;
    cfg.base_path = tmp.path();
    cfg.backend = "memory";
    auto pool = std::make_shared<InstancePool>(1);

    VectorStore store(cfg, pool);
    ASSERT_TRUE(store.initialize().has_value());
    // Writes both the document index and the model index into a pool bounded to one entry
    ASSERT_TRUE(store.storeEmbedding(makeRecord(10, 1, {1, 0})).has_value());

    auto doc = store.searchDocument({1, 0}, 1, 1, std::string("m1"), 2);
    ASSERT_TRUE(doc.has_value()) << doc.error().message;
    EXPECT_EQ(doc.value().chunkIds, (std::vector<int64_t>{10}));

    auto corpus = store.search({1, 0}, 1, std::string("m1"), 2);
    ASSERT_TRUE(corpus.has_value());
    EXPECT_EQ(corpus.value().chunkIds, (std::vector<int64_t>{10}));
    EXPECT_EQ(pool->stats().evictions, 0u);
}

TEST(EmbeddingRecordTest, FromJson) {
    auto j = nlohmann::json::parse(R"({
        "chunkId": 42.0, "documentId": 7, "content": "hello",
        "embedding": [0.5, 1, -2], "model": "m1", "metadata": {"lang": "en"}
    })");
    auto rec = EmbeddingRecord::fromJson(j);
    ASSERT_TRUE(rec.has_value()) << rec.error().message;
    EXPECT_EQ(rec.value().chunkId, 42);
    EXPECT_EQ(rec.value().documentId, 7);
    EXPECT_EQ(rec.value().dimensions, 3u);
    EXPECT_EQ(rec.value().content, "hello");
    EXPECT_EQ(rec.value().metadata["lang"], "en");

    auto back = EmbeddingRecord::fromJson(rec.value().toJson());
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value().embedding, rec.value().embedding);
}

TEST(EmbeddingRecordTest, RejectsMalformed) {
    EXPECT_FALSE(EmbeddingRecord::fromJson(nlohmann::json::array()).has_value());
    EXPECT_FALSE(EmbeddingRecord::fromJson(
                     {{"chunkId", 1}, {"documentId", "x"}, {"embedding", {1}}, {"model", "m"}})
                     .has_value());
    EXPECT_FALSE(EmbeddingRecord::fromJson(
                     {{"chunkId", 1}, {"documentId", 1}, {"embedding", nlohmann::json::array()},
                      {"model", "m"}})
                     .has_value());
    EXPECT_FALSE(EmbeddingRecord::fromJson({{"chunkId", 1},
                                            {"documentId", 1},
                                            {"embedding", {1, "a"}},
                                            {"model", "m"}})
                     .has_value());
    EXPECT_FALSE(EmbeddingRecord::fromJson(
                     {{"chunkId", 1}, {"documentId", 1}, {"embedding", {1}}, {"model", ""}})
                     .has_value());
}
