#include <gtest/gtest.h>

#include "omd/config/config.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace omd::config {

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<omd::test::TempDirectory>();
  }

  std::unique_ptr<omd::test::TempDirectory> temp_dir_;
};

TEST_F(ConfigTest, Defaults) {
  Config config;
  EXPECT_EQ(config.compose.inline_position, core::InlinePosition::kBottom);
  EXPECT_EQ(config.compose.inline_template, core::InlineTemplate::kStandard);
  EXPECT_TRUE(config.compose.inline_inplace);
  EXPECT_EQ(config.defaults.kind, core::MetadataKind::kAll);
  EXPECT_EQ(config.defaults.add_kind, core::MetadataKind::kFrontmatter);
  EXPECT_EQ(config.defaults.extension, ".md");
  EXPECT_EQ(config.logging.level, "warn");
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, LoadsEverySection) {
  auto path = temp_dir_->createFile("config.toml", R"(
[compose]
inline_position = "top"
inline_template = "callout"
inline_inplace = false

[defaults]
kind = "inline"
add_kind = "inline"
recursive = false
extension = ".markdown"

[logging]
level = "debug"
file = true

[fields.tags]
frontmatter_separators = [" "]
inline_separators = [";", "|"]
default_kind = "inline"

[fields.status]
default_kind = "frontmatter"
)");

  auto config = Config::fromFile(path);
  ASSERT_OK(config);
  EXPECT_EQ(config->path(), path);
  EXPECT_EQ(config->compose.inline_position, core::InlinePosition::kTop);
  EXPECT_EQ(config->compose.inline_template, core::InlineTemplate::kCallout);
  EXPECT_FALSE(config->compose.inline_inplace);
  EXPECT_EQ(config->defaults.kind, core::MetadataKind::kInline);
  EXPECT_FALSE(config->defaults.recursive);
  EXPECT_EQ(config->defaults.extension, ".markdown");
  EXPECT_EQ(config->logging.level, "debug");
  EXPECT_TRUE(config->logging.file);

  auto parse_options = config->parseOptions();
  EXPECT_EQ(parse_options.frontmatter_separators.at("tags"), (std::vector<std::string>{" "}));
  EXPECT_EQ(parse_options.inline_separators.at("tags"), (std::vector<std::string>{";", "|"}));
  EXPECT_FALSE(parse_options.frontmatter_separators.contains("status"));

  auto defaults = config->fieldDefaults();
  EXPECT_EQ(defaults.at("tags"), core::MetadataKind::kInline);
  EXPECT_EQ(defaults.at("status"), core::MetadataKind::kFrontmatter);

  auto compose = config->composeOptions();
  EXPECT_EQ(compose.inline_position, core::InlinePosition::kTop);
  EXPECT_FALSE(compose.inline_inplace);
}

TEST_F(ConfigTest, MissingExplicitFileIsAnError) {
  EXPECT_ERROR(Config::fromFile(temp_dir_->path() / "missing.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, InvalidValuesAreConfigErrors) {
  auto bad_enum = temp_dir_->createFile("enum.toml", "[compose]\ninline_position = \"middle\"\n");
  EXPECT_ERROR(Config::fromFile(bad_enum), ErrorCode::kConfigError);

  auto bad_toml = temp_dir_->createFile("syntax.toml", "[compose\n");
  EXPECT_ERROR(Config::fromFile(bad_toml), ErrorCode::kConfigError);

  auto bad_level = temp_dir_->createFile("level.toml", "[logging]\nlevel = \"loud\"\n");
  EXPECT_ERROR(Config::fromFile(bad_level), ErrorCode::kConfigError);

  auto bad_kind = temp_dir_->createFile("kind.toml", "[fields.tags]\ndefault_kind = \"all\"\n");
  EXPECT_ERROR(Config::fromFile(bad_kind), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, GetAndSetByDottedKey) {
  Config config;
  ASSERT_OK(config.set("compose.inline_position", "top"));
  ASSERT_OK(config.set("defaults.recursive", "false"));
  ASSERT_OK(config.set("fields.tags.inline_separators", ";"));
  ASSERT_OK(config.set("fields.tags.default_kind", "inline"));

  EXPECT_EQ(*config.get("compose.inline_position"), "top");
  EXPECT_EQ(*config.get("defaults.recursive"), "false");
  EXPECT_EQ(*config.get("fields.tags.inline_separators"), "[\";\"]");
  EXPECT_EQ(*config.get("fields.tags.default_kind"), "inline");
}

TEST_F(ConfigTest, SetRejectsBadInput) {
  Config config;
  EXPECT_ERROR(config.set("compose.inline_position", "middle"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("defaults.recursive", "maybe"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("logging.level", "loud"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("nothing.here", "x"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("fields.tags.color", "red"), ErrorCode::kConfigError);
  EXPECT_TRUE(config.fields.empty());

  EXPECT_ERROR(config.get("fields.unknown.default_kind"), ErrorCode::kNotFound);
}

TEST_F(ConfigTest, SaveAndReload) {
  Config config;
  config.compose.inline_template = core::InlineTemplate::kCallout;
  config.defaults.add_kind = core::MetadataKind::kInline;
  config.fields["tags"].frontmatter_separators = {" "};
  config.fields["tags"].default_kind = core::MetadataKind::kInline;

  auto path = temp_dir_->path() / "nested" / "config.toml";
  ASSERT_OK(config.save(path));

  auto reloaded = Config::fromFile(path);
  ASSERT_OK(reloaded);
  EXPECT_EQ(reloaded->compose.inline_template, core::InlineTemplate::kCallout);
  EXPECT_EQ(reloaded->defaults.add_kind, core::MetadataKind::kInline);
  EXPECT_EQ(reloaded->fields.at("tags").frontmatter_separators, (std::vector<std::string>{" "}));
  EXPECT_EQ(reloaded->fields.at("tags").default_kind, core::MetadataKind::kInline);
}

TEST_F(ConfigTest, ValidateChecksExtensionAndSeparators) {
  Config config;
  config.defaults.extension = "md";
  EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);

  config.defaults.extension = ".md";
  config.fields["tags"].inline_separators = {""};
  EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
}

}  // namespace omd::config
