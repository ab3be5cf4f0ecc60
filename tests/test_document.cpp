/**
 * @file test_document.cpp
 * @brief Unit tests for the document model (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "tomlcli/Document.hpp"
#include "tomlcli/Loader.hpp"
#include "TestSupport.hpp"

using namespace tomlcli;
using tomlcli_test::keys_of;

using Keys = std::vector<std::string>;

// ============================================================================
// Ordered tables
// ============================================================================

TEST(TableTest, PreservesInsertionOrder) {
    Value t(Table{});
    t.as_table().emplace("zeta", Value(1));
    t.as_table().emplace("alpha", Value(2));
    t.as_table().emplace("mid", Value(3));

    EXPECT_EQ(keys_of(t), (Keys{"zeta", "alpha", "mid"}));
}

TEST(TableTest, EmptyStringIsAValidKey) {
    Value t(Table{});
    t.as_table().emplace("", Value("empty"));
    ASSERT_TRUE(t.contains(""));
    EXPECT_EQ(t.at("").as_string(), "empty");
}

TEST(TableTest, AssignmentKeepsPosition) {
    Value t(Table{});
    t.as_table().emplace("a", Value(1));
    t.as_table().emplace("b", Value(2));
    t.as_table().emplace("c", Value(3));

    t.as_table().at("b") = Value("new");

    EXPECT_EQ(keys_of(t), (Keys{"a", "b", "c"}));
    EXPECT_EQ(t.at("b").as_string(), "new");
}

// ============================================================================
// Type tags
// ============================================================================

TEST(NodeTypeTest, ScalarTags) {
    EXPECT_EQ(node_type(Value("s")), NodeType::string);
    EXPECT_EQ(node_type(Value(17)), NodeType::integer);
    EXPECT_EQ(node_type(Value(1.5)), NodeType::floating_point);
    EXPECT_EQ(node_type(Value(true)), NodeType::boolean);
    EXPECT_EQ(node_type(Value(Array{})), NodeType::array);
    EXPECT_EQ(node_type(Value()), NodeType::empty);
}

TEST(NodeTypeTest, DatetimeKindsShareOneTag) {
    Value root = parse_document(
        "odt = 1979-05-27T07:32:00Z\n"
        "ldt = 1979-05-27T07:32:00\n"
        "ld = 1979-05-27\n"
        "lt = 07:32:00\n");

    for (const char* key : {"odt", "ldt", "ld", "lt"}) {
        EXPECT_EQ(node_type(root.at(key)), NodeType::datetime) << key;
    }
}

TEST(NodeTypeTest, InlineTablesAreValues) {
    Value root = parse_document("it = { a = 1 }\n[std]\nb = 2\n");

    EXPECT_EQ(node_type(root.at("it")), NodeType::inline_table);
    EXPECT_FALSE(is_container_table(root.at("it")));
    EXPECT_EQ(node_type(root.at("std")), NodeType::table);
    EXPECT_TRUE(is_container_table(root.at("std")));
}

TEST(NodeTypeTest, ImplicitAndDottedTablesAreContainers) {
    Value root = parse_document("d.e = 1\n[a.b]\nc = 2\n");

    EXPECT_TRUE(is_container_table(root.at("d")));
    EXPECT_TRUE(is_container_table(root.at("a")));
    EXPECT_TRUE(is_container_table(root.at("a").at("b")));
}

TEST(NodeTypeTest, NewTableIsContainer) {
    EXPECT_TRUE(is_container_table(Value(Table{})));
}

TEST(NodeTypeTest, TypeNames) {
    Value root = parse_document("it = { a = 1 }\nd = 1979-05-27\n");

    EXPECT_STREQ(type_name(Value("s")), "string");
    EXPECT_STREQ(type_name(Value(1)), "integer");
    EXPECT_STREQ(type_name(Value(1.0)), "float");
    EXPECT_STREQ(type_name(Value(false)), "boolean");
    EXPECT_STREQ(type_name(Value(Array{})), "array");
    EXPECT_STREQ(type_name(Value(Table{})), "table");
    EXPECT_STREQ(type_name(root.at("it")), "inline table");
    EXPECT_STREQ(type_name(root.at("d")), "datetime");
}
