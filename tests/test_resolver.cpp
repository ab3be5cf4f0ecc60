/**
 * @file test_resolver.cpp
 * @brief Unit tests for key path resolution (GoogleTest)
 *
 * Covers:
 * - get: lookup through bare, quoted, empty, dotted and spaced paths
 * - get: NotFoundError for missing keys at any depth
 * - TypeConflictError when traversing scalars, arrays and inline tables
 * - set: insertion point reporting without touching the document
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "tomlcli/Resolver.hpp"
#include "tomlcli/Loader.hpp"
#include "TestSupport.hpp"

using namespace tomlcli;

class ResolveGetTest : public ::testing::Test {
protected:
    Value root = parse_document(tomlcli_test::kInput);

    std::string get_string(const std::string& path) {
        const Value& node = resolve_get(root, parse_key_path(path));
        EXPECT_TRUE(node.is_string()) << path;
        return node.is_string() ? node.as_string() : std::string();
    }
};

// ============================================================================
// get - successful lookups
// ============================================================================

TEST_F(ResolveGetTest, TopLevelString) {
    EXPECT_EQ(get_string("key"), "value");
}

TEST_F(ResolveGetTest, IntegerAndBoolean) {
    EXPECT_EQ(resolve_get(root, parse_key_path("int")).as_integer(), 17);
    EXPECT_TRUE(resolve_get(root, parse_key_path("bool")).as_boolean());
}

TEST_F(ResolveGetTest, BareKey) {
    EXPECT_EQ(get_string("bare-Key_1"), "bare");
}

TEST_F(ResolveGetTest, QuotedKey) {
    EXPECT_EQ(get_string("\"quoted key‽\""), "quoted");
}

TEST_F(ResolveGetTest, EmptyQuotedKey) {
    EXPECT_EQ(get_string("\"\""), "empty");
}

TEST_F(ResolveGetTest, DottedKeys) {
    EXPECT_EQ(get_string("dotted.a"), "dotted-a");
    EXPECT_EQ(get_string("dotted.b"), "dotted-b");
}

TEST_F(ResolveGetTest, SpacedPathResolvesToSameNode) {
    const Value& spaced = resolve_get(root, parse_key_path("dotted . b"));
    const Value& plain = resolve_get(root, parse_key_path("dotted.b"));
    EXPECT_EQ(&spaced, &plain);
}

TEST_F(ResolveGetTest, QuotedSegmentsResolveLikeBareOnes) {
    const Value& quoted = resolve_get(root, parse_key_path("\"foo\".'x'"));
    const Value& plain = resolve_get(root, parse_key_path("foo.x"));
    EXPECT_EQ(&quoted, &plain);
}

TEST_F(ResolveGetTest, Nested) {
    EXPECT_EQ(get_string("foo.x"), "foo-x");
    EXPECT_EQ(get_string("foo.y.yy"), "foo-yy");
}

TEST_F(ResolveGetTest, TableLeaf) {
    const Value& foo = resolve_get(root, parse_key_path("foo"));
    EXPECT_TRUE(is_container_table(foo));
}

// ============================================================================
// get - errors
// ============================================================================

TEST_F(ResolveGetTest, MissingTopLevelKey) {
    EXPECT_THROW(resolve_get(root, parse_key_path("nosuchkey")), NotFoundError);
}

TEST_F(ResolveGetTest, MissingNestedKey) {
    EXPECT_THROW(resolve_get(root, parse_key_path("foo.nosuch")), NotFoundError);
}

TEST_F(ResolveGetTest, MissingIntermediateKey) {
    try {
        resolve_get(root, parse_key_path("nosuch.x.y"));
        FAIL() << "Expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.path(), "nosuch.x.y");
        EXPECT_EQ(e.segment(), "nosuch");
    }
}

TEST_F(ResolveGetTest, CaseMismatchIsNotFound) {
    EXPECT_THROW(resolve_get(root, parse_key_path("KEY")), NotFoundError);
}

TEST_F(ResolveGetTest, TraverseThroughStringIsTypeConflict) {
    try {
        resolve_get(root, parse_key_path("key.sub"));
        FAIL() << "Expected TypeConflictError";
    } catch (const TypeConflictError& e) {
        EXPECT_EQ(e.path(), "key.sub");
        EXPECT_EQ(e.segment(), "key");
        EXPECT_EQ(e.expected(), "table");
        EXPECT_EQ(e.actual(), "string");
    }
}

TEST(ResolveTraversal, InlineTablesAreNotTraversed) {
    Value root = parse_document("it = { a = 1 }\n");
    try {
        resolve_get(root, parse_key_path("it.a"));
        FAIL() << "Expected TypeConflictError";
    } catch (const TypeConflictError& e) {
        EXPECT_EQ(e.actual(), "inline table");
    }
}

TEST(ResolveTraversal, ImplicitAndDottedTablesAreTraversed) {
    Value root = parse_document("d.e.f = 1\n[a.b]\nc = 2\n");
    EXPECT_EQ(resolve_get(root, parse_key_path("d.e.f")).as_integer(), 1);
    EXPECT_EQ(resolve_get(root, parse_key_path("a.b.c")).as_integer(), 2);
    EXPECT_TRUE(is_container_table(resolve_get(root, parse_key_path("a"))));
}

TEST(ResolveTraversal, ArraysAreNotTraversed) {
    Value root = parse_document("arr = [1, 2]\n[[p]]\nn = 1\n");
    EXPECT_THROW(resolve_get(root, parse_key_path("arr.0")), TypeConflictError);
    EXPECT_THROW(resolve_get(root, parse_key_path("p.n")), TypeConflictError);
}

// ============================================================================
// resolve() in set mode
// ============================================================================

TEST(ResolveSet, ExistingLeaf) {
    Value root = parse_document("[x]\ny = \"z\"\n");
    auto path = parse_key_path("x.y");

    Resolution r = resolve(root, path, ResolveMode::set);
    EXPECT_EQ(r.parent, &root.at("x"));
    EXPECT_EQ(r.next_segment, 1u);
    ASSERT_NE(r.leaf, nullptr);
    EXPECT_EQ(r.leaf->as_string(), "z");
    EXPECT_FALSE(r.creates_tables(path));
}

TEST(ResolveSet, MissingLeaf) {
    Value root = parse_document("[x]\ny = \"z\"\n");
    auto path = parse_key_path("x.new");

    Resolution r = resolve(root, path, ResolveMode::set);
    EXPECT_EQ(r.parent, &root.at("x"));
    EXPECT_EQ(r.leaf, nullptr);
    EXPECT_FALSE(r.creates_tables(path));
}

TEST(ResolveSet, MissingIntermediatesAreReportedNotCreated) {
    Value root = parse_document("a = 1\n");
    auto path = parse_key_path("new.b.c");

    Resolution r = resolve(root, path, ResolveMode::set);
    EXPECT_EQ(r.parent, &root);
    EXPECT_EQ(r.next_segment, 0u);
    EXPECT_EQ(r.leaf, nullptr);
    EXPECT_TRUE(r.creates_tables(path));
    EXPECT_EQ(root.as_table().size(), 1u);
}

TEST(ResolveSet, TraverseThroughStringIsTypeConflict) {
    Value root = parse_document("key = \"value\"\n");
    EXPECT_THROW(resolve(root, parse_key_path("key.sub"), ResolveMode::set),
                 TypeConflictError);
    EXPECT_TRUE(root.at("key").is_string());
}

TEST(ResolveSet, OverwritingTableIsTypeConflict) {
    Value root = parse_document("[t]\na = 1\n");
    try {
        resolve(root, parse_key_path("t"), ResolveMode::set);
        FAIL() << "Expected TypeConflictError";
    } catch (const TypeConflictError& e) {
        EXPECT_EQ(e.expected(), "value");
        EXPECT_EQ(e.actual(), "table");
    }
}

TEST(ResolveSet, InlineTableLeafCanBeReplaced) {
    Value root = parse_document("it = { a = 1 }\n");
    Resolution r = resolve(root, parse_key_path("it"), ResolveMode::set);
    ASSERT_NE(r.leaf, nullptr);
    EXPECT_EQ(node_type(*r.leaf), NodeType::inline_table);
}

TEST(ResolveSet, GetModeThroughResolve) {
    Value root = parse_document("[x]\ny = \"z\"\n");
    Resolution r = resolve(root, parse_key_path("x.y"), ResolveMode::get);
    ASSERT_NE(r.leaf, nullptr);
    EXPECT_EQ(r.leaf->as_string(), "z");
    EXPECT_THROW(resolve(root, parse_key_path("x.q"), ResolveMode::get), NotFoundError);
    EXPECT_THROW(resolve(root, parse_key_path("q.y"), ResolveMode::get), NotFoundError);
}
