#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include <nlohmann/json.hpp>

#include "omd/cli/application.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace omd::cli {

using omd::test::readFile;

class CliTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<omd::test::TempDirectory>();
    vault_ = temp_dir_->createSubdir("vault");

    // Keep the user's configuration out of the tests
    setenv("XDG_CONFIG_HOME", (temp_dir_->path() / "config").c_str(), 1);
    setenv("XDG_DATA_HOME", (temp_dir_->path() / "data").c_str(), 1);
  }

  void TearDown() override {
    unsetenv("XDG_CONFIG_HOME");
    unsetenv("XDG_DATA_HOME");
    temp_dir_.reset();
  }

  struct RunResult {
    int code = 0;
    std::string out;
    std::string err;
  };

  // Runs one command line on a fresh application, capturing its output
  RunResult run(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("omd"));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }

    std::ostringstream out, err;
    auto* orig_cout = std::cout.rdbuf(out.rdbuf());
    auto* orig_cerr = std::cerr.rdbuf(err.rdbuf());

    RunResult result;
    try {
      Application app;
      result.code = app.run(static_cast<int>(argv.size()), argv.data());
    } catch (...) {
      std::cout.rdbuf(orig_cout);
      std::cerr.rdbuf(orig_cerr);
      throw;
    }

    std::cout.rdbuf(orig_cout);
    std::cerr.rdbuf(orig_cerr);
    result.out = out.str();
    result.err = err.str();
    return result;
  }

  std::filesystem::path note(const std::string& name, const std::string& content) {
    return temp_dir_->createFile("vault/" + name, content);
  }

  std::unique_ptr<omd::test::TempDirectory> temp_dir_;
  std::filesystem::path vault_;
};

TEST_F(CliTest, AddToEveryNoteInDirectory) {
  auto first = note("first.md", "---\ntitle: First\n---\nBody\n");
  auto second = note("sub/second.md", "Plain body\n");

  auto result = run({"--no-color", "add", "tags", "draft", "-n", vault_.string()});
  EXPECT_EQ(result.code, 0) << result.err;

  EXPECT_EQ(readFile(first), "---\ntitle: First\ntags: draft\n---\nBody\n");
  EXPECT_EQ(readFile(second), "---\ntags: draft\n---\nPlain body\n");
  EXPECT_NE(result.out.find("updated " + first.string()), std::string::npos);
}

TEST_F(CliTest, AddInlineAtTopWithCallout) {
  auto path = note("n.md", "Body\n");

  auto result = run({"add", "status", "open", "--kind", "inline", "--position", "top",
                     "--template", "callout", "-n", path.string()});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(readFile(path), "> [!info]- metadata\n> status :: open\n\nBody\n");
}

TEST_F(CliTest, MoveTagsInline) {
  auto path = note("tags.md",
                   "---\ntags: [t1, t2, t3]\n---\nText\n\ntags:: t4, t5, t6\n");

  auto result = run({"mv", "tags", "--from", "frontmatter", "--to", "inline", "-n", path.string()});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(readFile(path), "Text\n\ntags :: t4, t5, t6, t1, t2, t3\n");
}

TEST_F(CliTest, RemoveValuesOnlyFromMatchingNotes) {
  auto match = note("2024-01-01.md", "---\ntags: [t1, t2, t3]\n---\n");
  auto other = note("ideas.md", "---\ntags: [t1, t2, t3]\n---\n");

  auto result = run({"rm", "tags", "t1", "t3", "--starts-with", "2024-", "-n", vault_.string()});
  EXPECT_EQ(result.code, 0) << result.err;

  EXPECT_EQ(readFile(match), "---\ntags: t2\n---\n");
  EXPECT_EQ(readFile(other), "---\ntags: [t1, t2, t3]\n---\n");
}

TEST_F(CliTest, HasFilterSelectsNotes) {
  auto draft = note("a.md", "---\nstatus: draft\n---\n");
  auto done = note("b.md", "---\nstatus: done\n---\n");

  auto result = run({"add", "review", "--has", "status=draft@frontmatter", "-n", vault_.string()});
  EXPECT_EQ(result.code, 0) << result.err;

  EXPECT_EQ(readFile(draft), "---\nstatus: draft\nreview:\n---\n");
  EXPECT_EQ(readFile(done), "---\nstatus: done\n---\n");
}

TEST_F(CliTest, OrderKeysAndValues) {
  auto path = note("o.md", "---\nf2: [3, 1, 2]\nf0: [c, a, b]\nf1: z\n---\n");

  auto result = run({"order", "--key-order", "asc", "--value-order", "asc", "-n", path.string()});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(readFile(path),
            "---\nf0:\n  - a\n  - b\n  - c\nf1: z\nf2:\n  - 1\n  - 2\n  - 3\n---\n");
}

TEST_F(CliTest, OrderNeedsADirection) {
  note("o.md", "---\na: 1\n---\n");
  auto result = run({"--no-color", "order", "-n", vault_.string()});
  EXPECT_NE(result.code, 0);
  EXPECT_NE(result.err.find("--key-order"), std::string::npos);
}

TEST_F(CliTest, DedupeAndPrune) {
  auto path = note("d.md", "---\ntags: [a, b, a]\nempty:\n---\nx:: 1, 1\n");

  ASSERT_EQ(run({"dedupe", "-n", path.string()}).code, 0);
  ASSERT_EQ(run({"prune", "--kind", "frontmatter", "-n", path.string()}).code, 0);

  EXPECT_EQ(readFile(path), "---\ntags:\n  - a\n  - b\n---\nx :: 1\n");
}

TEST_F(CliTest, DryRunLeavesFilesAlone) {
  std::string content = "---\ntitle: T\n---\n";
  auto path = note("t.md", content);

  auto result = run({"add", "tags", "x", "--dry-run", "-n", path.string()});
  EXPECT_EQ(result.code, 0);
  EXPECT_NE(result.out.find("would update"), std::string::npos);
  EXPECT_EQ(readFile(path), content);
}

TEST_F(CliTest, BrokenNoteDoesNotStopTheBatch) {
  auto broken = note("broken.md", "---\ntitle: [unclosed\n---\n");
  auto good = note("good.md", "Body\n");

  auto result = run({"--json", "add", "k", "v", "-n", vault_.string()});
  EXPECT_EQ(result.code, 1);
  EXPECT_EQ(readFile(good), "---\nk: v\n---\nBody\n");
  EXPECT_EQ(readFile(broken), "---\ntitle: [unclosed\n---\n");

  auto report = nlohmann::json::parse(result.out);
  EXPECT_EQ(report["command"], "add");
  EXPECT_EQ(report["written"].size(), 1u);
  ASSERT_EQ(report["failures"].size(), 1u);
  EXPECT_EQ(report["failures"][0]["operation"], "load");
  EXPECT_EQ(report["failures"][0]["code"], "Invalid frontmatter");
}

TEST_F(CliTest, GetPrintsJson) {
  note("a.md", "---\ntags: [t1]\n---\ntags:: t2\n");
  note("b.md", "No metadata\n");

  auto result = run({"get", "tags", "--json", "-n", vault_.string()});
  EXPECT_EQ(result.code, 0) << result.err;

  auto output = nlohmann::json::parse(result.out);
  ASSERT_EQ(output.size(), 1u);
  EXPECT_EQ(output[0]["key"], "tags");
  EXPECT_EQ(output[0]["values"], nlohmann::json({"t1", "t2"}));

  auto with_missing = run({"get", "tags", "--missing", "--kind", "inline", "--json", "-n",
                           vault_.string()});
  auto all = nlohmann::json::parse(with_missing.out);
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0]["values"], nlohmann::json({"t2"}));
  EXPECT_TRUE(all[1]["values"].is_null());
}

TEST_F(CliTest, ShowListsBothStores) {
  auto path = note("s.md", "---\nb: 1\na: 2\n---\nc:: 3\n");

  auto result = run({"show", "--json", "-n", path.string()});
  EXPECT_EQ(result.code, 0) << result.err;

  auto output = nlohmann::ordered_json::parse(result.out);
  auto& entry = output[path.string()];
  EXPECT_EQ(entry["frontmatter"].dump(), R"({"b":["1"],"a":["2"]})");
  EXPECT_EQ(entry["inline"]["c"], nlohmann::ordered_json({"3"}));
}

TEST_F(CliTest, AppendAndSub) {
  auto path = note("e.md", "status:: open\nHello world\n");

  ASSERT_EQ(run({"sub", "world", "there", "-n", path.string()}).code, 0);
  ASSERT_EQ(run({"append", "due:: friday", "-n", path.string()}).code, 0);
  ASSERT_EQ(run({"append", "due:: friday", "-n", path.string()}).code, 0);

  EXPECT_EQ(readFile(path), "status:: open\nHello there\n\ndue:: friday");
}

TEST_F(CliTest, MoveUsesConfiguredDefaults) {
  auto config = temp_dir_->createFile("omd.toml", "[fields.tags]\ndefault_kind = \"inline\"\n");
  auto path = note("m.md", "---\ntags: [a]\ntitle: T\n---\nBody\n");

  auto result = run({"--config", config.string(), "mv", "-n", path.string()});
  EXPECT_EQ(result.code, 0) << result.err;
  EXPECT_EQ(readFile(path), "---\ntitle: T\n---\nBody\n\ntags:: a\n");
}

TEST_F(CliTest, ConfigSetAndGet) {
  auto config = temp_dir_->createFile("omd.toml", "");

  auto set = run({"--config", config.string(), "config", "set", "compose.inline_position", "top"});
  EXPECT_EQ(set.code, 0) << set.err;

  auto get = run({"--config", config.string(), "config", "get", "compose.inline_position"});
  EXPECT_EQ(get.code, 0) << get.err;
  EXPECT_EQ(get.out, "top\n");

  auto bad = run({"--config", config.string(), "config", "set", "compose.inline_position", "middle"});
  EXPECT_NE(bad.code, 0);
}

TEST_F(CliTest, MissingPathIsAnError) {
  auto result = run({"--no-color", "add", "k", "-n", (vault_ / "nope.md").string()});
  EXPECT_NE(result.code, 0);
  EXPECT_NE(result.err.find("does not exist"), std::string::npos);
}

}  // namespace omd::cli
