#include <gtest/gtest.h>

#include "omd/store/note_query.hpp"
#include "test_helpers.hpp"

using namespace omd::store;
using namespace omd::core;
using omd::ErrorCode;

TEST(MetadataPredicateTest, ParsesKeyOnly) {
  auto predicate = MetadataPredicate::parse("tags");
  ASSERT_OK(predicate);
  EXPECT_EQ(predicate->key, "tags");
  EXPECT_FALSE(predicate->values.has_value());
  EXPECT_EQ(predicate->kind, MetadataKind::kAll);
}

TEST(MetadataPredicateTest, ParsesValuesAndKind) {
  auto predicate = MetadataPredicate::parse(" tags = a, b@inline", MetadataKind::kFrontmatter);
  ASSERT_OK(predicate);
  EXPECT_EQ(predicate->key, "tags");
  EXPECT_EQ(*predicate->values, (Values{"a", "b"}));
  EXPECT_EQ(predicate->kind, MetadataKind::kInline);
}

TEST(MetadataPredicateTest, DefaultKindApplies) {
  auto predicate = MetadataPredicate::parse("tags=", MetadataKind::kFrontmatter);
  ASSERT_OK(predicate);
  EXPECT_EQ(predicate->kind, MetadataKind::kFrontmatter);
  ASSERT_TRUE(predicate->values.has_value());
  EXPECT_TRUE(predicate->values->empty());
}

TEST(MetadataPredicateTest, RejectsBadInput) {
  EXPECT_ERROR(MetadataPredicate::parse("=a"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(MetadataPredicate::parse("tags@nowhere"), ErrorCode::kInvalidArgument);
}

TEST(NoteQueryTest, EmptyQueryMatchesEverything) {
  auto query = NoteQuery::compile({});
  ASSERT_OK(query);
  EXPECT_TRUE(query->empty());
  EXPECT_TRUE(query->matchesPath("any/file.md"));
}

TEST(NoteQueryTest, FileNameConditions) {
  QueryOptions options;
  options.starts_with = "2024-";
  options.ends_with = ".md";
  options.pattern = R"(\d{4}-\d{2})";
  auto query = NoteQuery::compile(options);
  ASSERT_OK(query);

  EXPECT_TRUE(query->matchesPath("vault/2024-05 meeting.md"));
  EXPECT_FALSE(query->matchesPath("2024-05/notes.md"));
  EXPECT_FALSE(query->matchesPath("vault/2024-05.txt"));
}

TEST(NoteQueryTest, PatternIsAnchoredAtNameStart) {
  QueryOptions options;
  options.pattern = "meet";
  auto query = NoteQuery::compile(options);
  ASSERT_OK(query);

  EXPECT_TRUE(query->matchesPath("meeting.md"));
  EXPECT_FALSE(query->matchesPath("weekly meeting.md"));
}

TEST(NoteQueryTest, InvalidPatternIsRejected) {
  QueryOptions options;
  options.pattern = "([";
  EXPECT_ERROR(NoteQuery::compile(options), ErrorCode::kInvalidArgument);
}

TEST(NoteQueryTest, MetadataConditionsAreConjunctive) {
  auto note = omd::test::parsedNote("---\ntags: [a, b]\n---\nstatus:: open\n");

  QueryOptions options;
  options.has_meta.push_back(*MetadataPredicate::parse("tags=a"));
  options.has_meta.push_back(*MetadataPredicate::parse("status@inline"));
  auto query = NoteQuery::compile(options);
  ASSERT_OK(query);
  EXPECT_TRUE(query->matchesMetadata(note));

  options.has_meta.push_back(*MetadataPredicate::parse("status@frontmatter"));
  auto narrower = NoteQuery::compile(options);
  ASSERT_OK(narrower);
  EXPECT_FALSE(narrower->matchesMetadata(note));
}
