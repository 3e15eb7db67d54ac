#include "summarize.hpp"
#include "citation.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

class SummarizeTest : public ::testing::Test {
protected:
  void SetUp() override {
    main_id = seed_file(store, "main.py", {{1, 3, "function", "def main():\n    run()\n"}});
    a_id = seed_file(store, "pkg/a.py", {{1, 2, "function", "def alpha():\n    pass"},
                                         {4, 6, "class", "class Beta:\n    pass"}});
    b_id = seed_file(store, "pkg/b.py", {{1, 1, "block", "items = [1, 2]"}});
  }
  Store store;
  int64_t main_id = 0, a_id = 0, b_id = 0;
};

TEST_F(SummarizeTest, FileSummaryCitesItsFirstChunk) {
  EchoSummarizer summ;
  auto s = summarize_file(store, summ, a_id);
  ASSERT_TRUE(s);
  EXPECT_EQ(s->level, SummaryLevel::File);
  EXPECT_EQ(s->target_id, a_id);
  EXPECT_EQ(s->text, "Summary: def alpha(): [pkg/a.py:1-2]");
  EXPECT_DOUBLE_EQ(s->confidence, 0.7);
  EXPECT_GT(s->id, 0);
}

TEST_F(SummarizeTest, ModelBracketsNeverPoseAsCitations) {
  EchoSummarizer summ;
  auto s = summarize_file(store, summ, b_id);
  ASSERT_TRUE(s);
  EXPECT_EQ(s->text, "Summary: items = (1, 2) [pkg/b.py:1-1]");
  EXPECT_NO_THROW(validate_summary(*s, store));
}

TEST_F(SummarizeTest, SuggestedCitationsMustResolve) {
  EchoSummarizer summ;
  summ.suggested = {"pkg/a.py:4-6", "pkg/a.py:40-60", "junk"};
  auto s = summarize_file(store, summ, a_id);
  ASSERT_TRUE(s);
  EXPECT_EQ(extract_citations(s->text), (std::vector<std::string>{"pkg/a.py:1-2", "pkg/a.py:4-6"}));
}

TEST_F(SummarizeTest, ChunkSummariesOnePerChunk) {
  EchoSummarizer summ;
  auto out = summarize_chunks(store, summ, a_id);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1].level, SummaryLevel::Chunk);
  EXPECT_EQ(extract_citations(out[1].text), (std::vector<std::string>{"pkg/a.py:4-6"}));
  EXPECT_THROW(summarize_chunks(store, summ, 999), std::runtime_error);
}

TEST_F(SummarizeTest, RepoTreeHasModulesPerDirectoryAndOnePackage) {
  EchoSummarizer summ;
  SummarizeOptions opts;
  opts.quiet = true;
  auto tree = summarize_repo(store, summ, "demo", opts);
  EXPECT_EQ(tree.files.size(), 3u);
  EXPECT_EQ(tree.modules.size(), 2u);
  ASSERT_TRUE(tree.package);
  EXPECT_EQ(tree.skipped, 0);
  EXPECT_TRUE(tree.chunks.empty());

  EXPECT_EQ(store.summaries(SummaryLevel::Module).size(), 2u);
  EXPECT_EQ(store.summaries(SummaryLevel::Package).size(), 1u);
  for (auto& s : store.summaries()) EXPECT_NO_THROW(validate_summary(s, store)) << s.text;
  // inherited citations are capped
  EXPECT_LE(extract_citations(tree.package->text).size(), 3u);
}

TEST_F(SummarizeTest, FailuresAndUnparsedFilesAreSkipped) {
  auto f = *store.file_by_id(main_id);
  f.parsed = false;
  store.update_file(f);

  EchoSummarizer summ;
  summ.fail_on_call = 1;
  SummarizeOptions opts;
  opts.quiet = true;
  opts.chunk_level = true;
  auto tree = summarize_repo(store, summ, "demo", opts);
  // first call is the first chunk of pkg/a.py
  EXPECT_EQ(tree.chunks.size(), 2u);
  EXPECT_EQ(tree.files.size(), 2u);
  EXPECT_EQ(tree.modules.size(), 1u);
  EXPECT_TRUE(tree.package);
}

TEST_F(SummarizeTest, RerunReplacesEarlierSummaries) {
  EchoSummarizer summ;
  SummarizeOptions opts;
  opts.quiet = true;
  opts.chunk_level = true;
  summarize_repo(store, summ, "demo", opts);
  summarize_repo(store, summ, "demo", opts);
  EXPECT_EQ(store.summaries(SummaryLevel::Chunk).size(), 4u);
  EXPECT_EQ(store.summaries(SummaryLevel::File).size(), 3u);
  EXPECT_EQ(store.summaries(SummaryLevel::Module).size(), 2u);
  EXPECT_EQ(store.summaries(SummaryLevel::Package).size(), 1u);
}

TEST(SummarizeSpacedPaths, CitationsSurviveValidation) {
  Store store;
  seed_file(store, "docs/my notes.md", {{1, 3, "paragraph", "Setup steps\nrun make\nthen test"}}, "markdown");
  seed_file(store, "src/main.py", {{1, 2, "function", "def main():\n    pass"}});
  EchoSummarizer summ;
  SummarizeOptions opts;
  opts.quiet = true;
  SummaryTree tree;
  ASSERT_NO_THROW(tree = summarize_repo(store, summ, "demo", opts));
  EXPECT_EQ(tree.files.size(), 2u);
  EXPECT_EQ(tree.skipped, 0);
  auto files = store.summaries(SummaryLevel::File);
  ASSERT_EQ(files.size(), 2u);
  bool cited = false;
  for (auto& s : store.summaries()) {
    EXPECT_NO_THROW(validate_summary(s, store)) << s.text;
    for (auto& c : extract_citations(s.text)) cited = cited || c == "docs/my notes.md:1-3";
  }
  EXPECT_TRUE(cited);
}

TEST(ValidateSummary, RejectsUncitedAndUnresolvable) {
  Store store;
  auto f = seed_file(store, "a.py", {{1, 2, "block", "x"}});
  Summary s;
  s.level = SummaryLevel::File;
  s.target_id = f;
  s.text = "   ";
  EXPECT_THROW(validate_summary(s, store), FormatError);
  s.text = "Does things";
  EXPECT_THROW(validate_summary(s, store), FormatError);
  s.text = "Does things [a.py:5-9]";
  EXPECT_THROW(validate_summary(s, store), CitationError);
  s.text = "Does things [a.py:1-2]";
  EXPECT_NO_THROW(validate_summary(s, store));
}
