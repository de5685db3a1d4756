#include <gtest/gtest.h>
#include <vecstore/vector/table_identifier.h>

#include <regex>

using namespace vecstore;
using namespace vecstore::vector;

TEST(TableIdentifierTest, AcceptsRestrictedCharset) {
    auto id = TableIdentifier::create("vec_model-1_384");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value().str(), "vec_model-1_384");
    EXPECT_EQ(id.value().quoted(), "\"vec_model-1_384\"");
}

TEST(TableIdentifierTest, RejectsInjection) {
    for (const char* bad : {"", "vec; DROP TABLE x", "vec\"x", "vec x", "vec.x", "vec/x"}) {
        auto id = TableIdentifier::create(bad);
        ASSERT_FALSE(id.has_value()) << bad;
        EXPECT_EQ(id.error().code, ErrorCode::ValidationError);
    }
    EXPECT_FALSE(TableIdentifier::create(std::string(TableIdentifier::kMaxLength + 1, 'a'))
                     .has_value());
}

TEST(TableIdentifierTest, ForIndexIsDeterministicAndValid) {
    const std::regex allowed("^[A-Za-z0-9_-]+$");

    auto a = TableIdentifier::forIndex("sentence-transformers/all-MiniLM-L6-v2", 384);
    auto b = TableIdentifier::forIndex("sentence-transformers/all-MiniLM-L6-v2", 384);
    EXPECT_EQ(a, b);
    EXPECT_TRUE(std::regex_match(a.str(), allowed)) << a.str();
    EXPECT_TRUE(TableIdentifier::isValid(a.str()));

    auto doc = TableIdentifier::forIndex("m1", 4, 42);
    EXPECT_EQ(doc.str().rfind("vec_doc_42_m1_4_", 0), 0u) << doc.str();
}

TEST(TableIdentifierTest, ForIndexDistinguishesKeys) {
    // Same sanitized form, different raw model names
    EXPECT_NE(TableIdentifier::forIndex("a/b", 8), TableIdentifier::forIndex("a:b", 8));
    EXPECT_NE(TableIdentifier::forIndex("m", 8), TableIdentifier::forIndex("m", 16));
    EXPECT_NE(TableIdentifier::forIndex("m", 8), TableIdentifier::forIndex("m", 8, 1));
    EXPECT_NE(TableIdentifier::forIndex("m", 8, 1), TableIdentifier::forIndex("m", 8, 2));
}

TEST(TableIdentifierTest, WithSuffixRevalidates) {
    auto base = TableIdentifier::forIndex("m", 8);
    auto legacy = base.withSuffix("_legacy");
    ASSERT_TRUE(legacy.has_value());
    EXPECT_EQ(legacy.value().str(), base.str() + "_legacy");
    EXPECT_FALSE(base.withSuffix(" x").has_value());
}
