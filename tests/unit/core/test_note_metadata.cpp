#include <gtest/gtest.h>

#include "omd/core/note_metadata.hpp"
#include "test_helpers.hpp"

using namespace omd::core;
using omd::ErrorCode;

class NoteMetadataTest : public ::testing::Test {
 protected:
  NoteMetadata metadata_{MetadataStore{{"tags", {"t1", "t2", "t3"}}, {"title", {"Note"}}},
                         MetadataStore{{"tags", {"t4", "t5", "t6"}}, {"status", {"open"}}}};
};

TEST_F(NoteMetadataTest, MovePartitionsKey) {
  ASSERT_OK(metadata_.move({"tags"}, MetadataKind::kFrontmatter, MetadataKind::kInline));

  EXPECT_FALSE(metadata_.frontmatter().contains("tags"));
  EXPECT_EQ(*metadata_.inlineFields().get("tags"),
            (Values{"t4", "t5", "t6", "t1", "t2", "t3"}));
}

TEST_F(NoteMetadataTest, MoveWithoutKeysMovesEverySourceKey) {
  ASSERT_OK(metadata_.move({}, MetadataKind::kInline, MetadataKind::kFrontmatter));

  EXPECT_TRUE(metadata_.inlineFields().empty());
  EXPECT_EQ(metadata_.frontmatter().keys(),
            (std::vector<std::string>{"tags", "title", "status"}));
  EXPECT_EQ(*metadata_.frontmatter().get("tags"),
            (Values{"t1", "t2", "t3", "t4", "t5", "t6"}));
}

TEST_F(NoteMetadataTest, MoveOfMissingKeyIsNoop) {
  ASSERT_OK(metadata_.move({"missing"}, MetadataKind::kFrontmatter, MetadataKind::kInline));
  EXPECT_EQ(metadata_.frontmatter().size(), 2u);
  EXPECT_EQ(metadata_.inlineFields().size(), 2u);
}

TEST_F(NoteMetadataTest, MoveNeedsSingleKinds) {
  EXPECT_ERROR(metadata_.move({"tags"}, MetadataKind::kAll, MetadataKind::kInline),
               ErrorCode::kInvalidArgument);
  EXPECT_ERROR(metadata_.move({"tags"}, MetadataKind::kInline, MetadataKind::kAll),
               ErrorCode::kInvalidArgument);
}

TEST_F(NoteMetadataTest, AddWithoutValuesDeclaresKey) {
  metadata_.add("newmeta", std::nullopt, MetadataKind::kFrontmatter);

  auto values = metadata_.get("newmeta", MetadataKind::kFrontmatter);
  ASSERT_TRUE(values.has_value());
  EXPECT_TRUE(values->empty());
  EXPECT_TRUE(metadata_.has("newmeta", Values{}, MetadataKind::kFrontmatter));
  EXPECT_FALSE(metadata_.has("newmeta", Values{}, MetadataKind::kInline));
}

TEST_F(NoteMetadataTest, AddAllCreatesNewKeyInFrontmatter) {
  metadata_.add("fresh", Values{"x"}, MetadataKind::kAll);

  EXPECT_TRUE(metadata_.frontmatter().contains("fresh"));
  EXPECT_FALSE(metadata_.inlineFields().contains("fresh"));
}

TEST_F(NoteMetadataTest, AddAllExtendsEveryStoreHoldingKey) {
  metadata_.add("tags", Values{"x"}, MetadataKind::kAll);

  EXPECT_EQ(*metadata_.frontmatter().get("tags"), (Values{"t1", "t2", "t3", "x"}));
  EXPECT_EQ(*metadata_.inlineFields().get("tags"), (Values{"t4", "t5", "t6", "x"}));

  metadata_.add("status", Values{"done"}, MetadataKind::kAll, true);
  EXPECT_EQ(*metadata_.inlineFields().get("status"), (Values{"done"}));
  EXPECT_FALSE(metadata_.frontmatter().contains("status"));
}

TEST_F(NoteMetadataTest, RemoveValuesKeepsKey) {
  metadata_.remove("tags", Values{"t1", "t3"}, MetadataKind::kFrontmatter);

  EXPECT_EQ(*metadata_.frontmatter().get("tags"), (Values{"t2"}));
  EXPECT_EQ(*metadata_.inlineFields().get("tags"), (Values{"t4", "t5", "t6"}));
}

TEST_F(NoteMetadataTest, RemoveKeyFromAllStores) {
  metadata_.remove("tags", std::nullopt, MetadataKind::kAll);

  EXPECT_FALSE(metadata_.has("tags", std::nullopt, MetadataKind::kAll));
  EXPECT_FALSE(metadata_.get("tags", MetadataKind::kAll).has_value());
}

TEST_F(NoteMetadataTest, RemoveEmptyPerKind) {
  metadata_.add("a", std::nullopt, MetadataKind::kFrontmatter);
  metadata_.add("b", std::nullopt, MetadataKind::kInline);

  metadata_.removeEmpty(MetadataKind::kFrontmatter);
  EXPECT_FALSE(metadata_.frontmatter().contains("a"));
  EXPECT_TRUE(metadata_.inlineFields().contains("b"));

  metadata_.removeEmpty(MetadataKind::kAll);
  EXPECT_FALSE(metadata_.inlineFields().contains("b"));
}

TEST_F(NoteMetadataTest, GetConcatenatesFrontmatterThenInline) {
  EXPECT_EQ(*metadata_.get("tags", MetadataKind::kAll),
            (Values{"t1", "t2", "t3", "t4", "t5", "t6"}));
  EXPECT_EQ(*metadata_.get("tags", MetadataKind::kInline), (Values{"t4", "t5", "t6"}));
  EXPECT_EQ(*metadata_.get("status", MetadataKind::kAll), (Values{"open"}));
  EXPECT_FALSE(metadata_.get("status", MetadataKind::kFrontmatter).has_value());
}

TEST_F(NoteMetadataTest, HasWithValues) {
  EXPECT_TRUE(metadata_.has("tags", Values{"t1", "t2"}, MetadataKind::kAll));
  EXPECT_TRUE(metadata_.has("tags", Values{"t5"}, MetadataKind::kAll));
  // each store is checked on its own
  EXPECT_FALSE(metadata_.has("tags", Values{"t1", "t5"}, MetadataKind::kAll));
  EXPECT_FALSE(metadata_.has("tags", Values{"t1"}, MetadataKind::kInline));
}

TEST_F(NoteMetadataTest, DedupeAndOrder) {
  NoteMetadata metadata(MetadataStore{{"f2", {"3", "1", "3"}}, {"f0", {"b", "a"}}},
                        MetadataStore{{"z", {"b", "b", "a"}}});

  metadata.removeDuplicateValues({}, MetadataKind::kAll);
  EXPECT_EQ(*metadata.frontmatter().get("f2"), (Values{"3", "1"}));
  EXPECT_EQ(*metadata.inlineFields().get("z"), (Values{"b", "a"}));

  metadata.order({}, Order::kAsc, std::nullopt, MetadataKind::kFrontmatter);
  EXPECT_EQ(metadata.frontmatter().keys(), (std::vector<std::string>{"f0", "f2"}));
  EXPECT_EQ(*metadata.frontmatter().get("f0"), (Values{"b", "a"}));

  metadata.order({"f0"}, std::nullopt, Order::kAsc, MetadataKind::kAll);
  EXPECT_EQ(*metadata.frontmatter().get("f0"), (Values{"a", "b"}));
  EXPECT_EQ(*metadata.frontmatter().get("f2"), (Values{"3", "1"}));
  EXPECT_EQ(*metadata.inlineFields().get("z"), (Values{"b", "a"}));
}

TEST_F(NoteMetadataTest, MoveToDefaults) {
  FieldDefaults defaults{{"tags", MetadataKind::kInline}, {"status", MetadataKind::kFrontmatter}};
  metadata_.moveToDefaults(defaults);

  EXPECT_FALSE(metadata_.frontmatter().contains("tags"));
  EXPECT_EQ(*metadata_.inlineFields().get("tags"),
            (Values{"t4", "t5", "t6", "t1", "t2", "t3"}));
  EXPECT_EQ(*metadata_.frontmatter().get("status"), (Values{"open"}));
  EXPECT_FALSE(metadata_.inlineFields().contains("status"));
  EXPECT_TRUE(metadata_.frontmatter().contains("title"));
}

TEST_F(NoteMetadataTest, StoreRejectsAll) {
  EXPECT_ERROR(metadata_.store(MetadataKind::kAll), ErrorCode::kInvalidArgument);
  auto inline_store = metadata_.store(MetadataKind::kInline);
  ASSERT_OK(inline_store);
  EXPECT_TRUE((*inline_store)->contains("status"));
}
