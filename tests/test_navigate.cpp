#include "test_helpers.hpp"

using namespace yedit_test;
using yedit::ErrorKind;
using yedit::KeyPath;
using yedit::resolve_table;
using yedit::TableLookup;

TEST(ResolveTableTest, EmptyPathReturnsRoot) {
  ordered_node root = ordered_node::mapping();
  TableLookup result = resolve_table( root, KeyPath() );
  ASSERT_TRUE(result);
  EXPECT_EQ(result.table, &root);
  EXPECT_EQ(root.size(), 0u);
}

TEST(ResolveTableTest, CreatesSingleKey) {
  ordered_node root = ordered_node::mapping();
  TableLookup result = resolve_table( root, KeyPath{ "a" } );
  ASSERT_TRUE(result);
  EXPECT_TRUE(result.table->is_mapping());
  EXPECT_EQ(result.table->size(), 0u);
  ASSERT_TRUE(has(root, "a"));
  EXPECT_TRUE(get(root, "a").is_mapping());
}

TEST(ResolveTableTest, CreatesNestedKeys) {
  ordered_node root = yaml( "a: {}\n" );
  TableLookup result = resolve_table( root, KeyPath{ "a", "b", "c" } );
  ASSERT_TRUE(result);
  EXPECT_EQ(result.table->size(), 0u);
  ASSERT_TRUE(has(get(root, "a"), "b"));
  EXPECT_TRUE(get(get(root, "a"), "b").is_mapping());
  ASSERT_TRUE(has(get(get(root, "a"), "b"), "c"));
  EXPECT_TRUE(get(get(get(root, "a"), "b"), "c").is_mapping());
}

TEST(ResolveTableTest, ExtendsExistingPath) {
  ordered_node root = yaml( "a:\n  b:\n    c: {}\n    keep: 1\n" );
  TableLookup result = resolve_table( root, KeyPath{ "a", "b", "c", "d" } );
  ASSERT_TRUE(result);
  EXPECT_EQ(result.table->size(), 0u);
  const ordered_node& b = get( get(root, "a"), "b" );
  EXPECT_TRUE(get(get(b, "c"), "d").is_mapping());
  EXPECT_EQ(integer(get(b, "keep")), 1);
}

TEST(ResolveTableTest, NonExistentKeysAreCreated) {
  ordered_node root = ordered_node::mapping();
  TableLookup result = resolve_table( root, KeyPath{ "x", "y" } );
  ASSERT_TRUE(result);
  ASSERT_TRUE(has(root, "x"));
  EXPECT_TRUE(get(root, "x").is_mapping());
  ASSERT_TRUE(has(get(root, "x"), "y"));
  EXPECT_TRUE(get(get(root, "x"), "y").is_mapping());
}

TEST(ResolveTableTest, SecondVisitReturnsSameTable) {
  ordered_node root = ordered_node::mapping();
  TableLookup first = resolve_table( root, KeyPath{ "p", "q" } );
  ASSERT_TRUE(first);
  ( *first.table )[ std::string("marker") ] = ordered_node( true );

  TableLookup second = resolve_table( root, KeyPath{ "p", "q" } );
  ASSERT_TRUE(second);
  EXPECT_EQ(first.table, second.table);
  EXPECT_TRUE(has(*second.table, "marker"));
  EXPECT_EQ(keys(root), (std::vector< std::string >{ "p" }));
}

TEST(ResolveTableTest, IntermediateScalarIsAConflict) {
  ordered_node root = yaml( "a: not_a_dict\n" );
  TableLookup result = resolve_table( root, KeyPath{ "a", "b" } );
  ASSERT_FALSE(result);
  ASSERT_TRUE(result.error);
  EXPECT_EQ(result.error->kind, ErrorKind::IntermediateConflict);
  EXPECT_TRUE(result.error->is_no_mapping());
  EXPECT_EQ(result.error->path, KeyPath{ "a" });
  EXPECT_EQ(str(result.error->found), "not_a_dict");

  // The conflicting value is left alone
  EXPECT_EQ(str(get(root, "a")), "not_a_dict");
}

TEST(ResolveTableTest, IntermediateSequenceIsAConflict) {
  ordered_node root = yaml( "t:\n  list: [1, 2]\n" );
  TableLookup result = resolve_table( root,
    KeyPath{ "t", "list", "x", "y" } );
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error->kind, ErrorKind::IntermediateConflict);
  EXPECT_EQ(result.error->path, (KeyPath{ "t", "list" }));
  EXPECT_TRUE(result.error->found.is_sequence());
  EXPECT_EQ(get(get(root, "t"), "list").size(), 2u);
  EXPECT_EQ(result.error->reason(),
    "Expected a mapping at key t.list, but got sequence");
}

TEST(ResolveTableTest, FinalNonMappingIsNotAMapping) {
  ordered_node root = yaml( "a: 3\n" );
  TableLookup result = resolve_table( root, KeyPath{ "a" } );
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error->kind, ErrorKind::NotAMapping);
  EXPECT_TRUE(result.error->is_no_mapping());
  EXPECT_EQ(result.error->path, KeyPath{ "a" });
  EXPECT_EQ(integer(result.error->found), 3);
  EXPECT_EQ(result.error->reason(),
    "Expected a mapping at key a, but got integer");
}

TEST(ResolveTableTest, NonMappingRootConflictsImmediately) {
  ordered_node root = yaml( "[1, 2]" );
  TableLookup result = resolve_table( root, KeyPath{ "a" } );
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error->kind, ErrorKind::IntermediateConflict);
  EXPECT_TRUE(result.error->path.empty());
  EXPECT_EQ(result.error->reason(),
    "Expected a mapping at key <root>, but got sequence");
}

TEST(ResolveTableTest, QuotedSegmentsAreSingleKeys) {
  ordered_node root = ordered_node::mapping();
  TableLookup result = resolve_table( root,
    KeyPath::parse("tool.\"dotted.name\"") );
  ASSERT_TRUE(result);
  ASSERT_TRUE(has(get(root, "tool"), "dotted.name"));
  EXPECT_FALSE(has(get(root, "tool"), "dotted"));
}
