#include "orchestrator.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

namespace {

const char* CALC =
  "def add(a, b):\n"
  "    \"\"\"Adds two numbers.\"\"\"\n"
  "    return a + b\n";

// Cites the first evidence block it was given.
std::string cite_first(const std::string&, const std::vector<std::string>& blocks) {
  std::string header = blocks.empty() ? "" : blocks[0].substr(0, blocks[0].find('\n'));
  return "# Calculator\n\n- The add function adds two numbers " + header + "\n";
}

PipelineConfig config_for(const TempTree& tree) {
  PipelineConfig cfg;
  cfg.root = tree.path();
  cfg.brief = "Describe the add function";
  cfg.quiet = true;
  return cfg;
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override { tree.write("calc.py", CALC); }
  TempTree tree;
};

TEST_F(OrchestratorTest, SupportedDraftPassesTheGateFirstTime) {
  ScriptedDrafter drafter({});
  drafter.builder = cite_first;
  KeywordGrader grader;
  Orchestrator orch(Store::Options(), drafter, grader);
  auto result = orch.run(config_for(tree));

  EXPECT_EQ(result.iterations, 1);
  EXPECT_EQ(orch.state(), PipelineState::Done);
  EXPECT_NE(result.report.find("[calc.py:1-3]"), std::string::npos);
  EXPECT_DOUBLE_EQ(result.metrics.coverage, 1.0);
  EXPECT_DOUBLE_EQ(result.metrics.support_rate, 1.0);
  EXPECT_EQ(result.metrics.issues_high, 0);
  ASSERT_EQ(result.claims.size(), 1u);
  EXPECT_GT(result.claims[0].id, 0);
  EXPECT_EQ(result.ingest.files_added, 1);

  ASSERT_EQ(drafter.prompts.size(), 1u);
  EXPECT_NE(drafter.prompts[0].find("Cite only these citations:\n[calc.py:1-3]"), std::string::npos);
  EXPECT_EQ(drafter.evidence[0].size(), 1u);

  const Store& store = orch.store();
  auto rv = store.report_version(result.version);
  ASSERT_TRUE(rv);
  EXPECT_EQ(rv->content, result.report);
  EXPECT_DOUBLE_EQ(rv->coverage_score, 1.0);
  EXPECT_EQ(store.claims_for_report(result.version).size(), 1u);
  EXPECT_EQ(store.iteration_status(result.version).size(), 1u);
  EXPECT_EQ(store.retrieval_events(result.version).size(), 1u);
}

TEST_F(OrchestratorTest, UncitedDraftIsCitedBeforeGrading) {
  ScriptedDrafter drafter({"- The add function adds two numbers"});
  KeywordGrader grader;
  Orchestrator orch(Store::Options(), drafter, grader);
  auto result = orch.run(config_for(tree));
  EXPECT_EQ(result.report, "- The add function adds two numbers [calc.py:1-3]");
  EXPECT_EQ(result.claims[0].status, ClaimStatus::Supported);
}

TEST_F(OrchestratorTest, FailingGateRevisesThenGivesUp) {
  ScriptedDrafter drafter({});
  drafter.builder = cite_first;
  FixedGrader grader(ClaimStatus::Contradicted);
  Orchestrator orch(Store::Options(), drafter, grader);
  auto cfg = config_for(tree);
  cfg.max_iters = 2;

  try {
    orch.run(cfg);
    FAIL() << "expected GateExhaustedError";
  } catch (const GateExhaustedError& e) {
    EXPECT_EQ(e.metrics.iteration, 2);
    EXPECT_EQ(e.metrics.issues_high, 1);
    EXPECT_DOUBLE_EQ(e.metrics.support_rate, 0.0);
  }
  ASSERT_EQ(drafter.prompts.size(), 2u);
  EXPECT_EQ(drafter.prompts[0].find("did not pass review"), std::string::npos);
  EXPECT_NE(drafter.prompts[1].find("did not pass review"), std::string::npos);
  EXPECT_NE(drafter.prompts[1].find("claim unresolved (contradicted)"), std::string::npos);
  // the same version is rewritten, its history lives in the logs
  auto versions = orch.store().report_versions();
  ASSERT_EQ(versions.size(), 1u);
  EXPECT_EQ(orch.store().iteration_status(versions[0].id).size(), 2u);
  EXPECT_EQ(orch.store().retrieval_events(versions[0].id).size(), 2u);
  EXPECT_EQ(orch.store().iteration_issues(versions[0].id).size(), 4u);
}

TEST_F(OrchestratorTest, LenientGateAcceptsUncertainClaims) {
  ScriptedDrafter drafter({});
  drafter.builder = cite_first;
  FixedGrader grader(ClaimStatus::Uncertain);
  Orchestrator orch(Store::Options(), drafter, grader);
  auto cfg = config_for(tree);
  cfg.gate = CoverageGate{0.0, 0.0, 0.5, 0, 5};
  auto result = orch.run(cfg);
  EXPECT_EQ(result.iterations, 1);
  EXPECT_EQ(result.metrics.issues_med, 1);
  EXPECT_EQ(result.issues.size(), 2u);
}

TEST(Orchestrator, EmptyRepoHasNoEvidence) {
  TempTree empty;
  ScriptedDrafter drafter({"- anything"});
  KeywordGrader grader;
  Orchestrator orch(Store::Options(), drafter, grader);
  EXPECT_THROW(orch.run(config_for(empty)), EvidenceError);
  EXPECT_TRUE(drafter.prompts.empty());
}

TEST_F(OrchestratorTest, CancelledBeforeDrafting) {
  ScriptedDrafter drafter({"- anything"});
  KeywordGrader grader;
  Orchestrator orch(Store::Options(), drafter, grader);
  CancellationToken token;
  token.cancel();
  EXPECT_THROW(orch.run(config_for(tree), token), CancelledError);
  EXPECT_TRUE(drafter.prompts.empty());
  EXPECT_EQ(orch.store().files().size(), 1u);
}

TEST_F(OrchestratorTest, DrafterFailurePropagates) {
  ScriptedDrafter drafter({});
  drafter.fail = true;
  KeywordGrader grader;
  Orchestrator orch(Store::Options(), drafter, grader);
  EXPECT_THROW(orch.run(config_for(tree)), CollaboratorError);
  EXPECT_TRUE(orch.store().report_versions().empty());
}

TEST_F(OrchestratorTest, RejectsZeroIterations) {
  ScriptedDrafter drafter({"- x"});
  KeywordGrader grader;
  Orchestrator orch(Store::Options(), drafter, grader);
  auto cfg = config_for(tree);
  cfg.max_iters = 0;
  EXPECT_THROW(orch.run(cfg), std::invalid_argument);
}

TEST_F(OrchestratorTest, SummariesAreBuiltWhenASummarizerIsGiven) {
  ScriptedDrafter drafter({});
  drafter.builder = cite_first;
  KeywordGrader grader;
  EchoSummarizer summ;
  Orchestrator orch(Store::Options(), drafter, grader, &summ);
  orch.run(config_for(tree));
  EXPECT_EQ(orch.store().summaries(SummaryLevel::File).size(), 1u);
  EXPECT_EQ(orch.store().summaries(SummaryLevel::Package).size(), 1u);
}

TEST_F(OrchestratorTest, PersistedStoreOutlivesTheRun) {
  TempTree dbdir;
  Store::Options opts;
  opts.path = dbdir.file("docs.db");
  opts.persist = true;
  int64_t version = 0;
  {
    ScriptedDrafter drafter({});
    drafter.builder = cite_first;
    KeywordGrader grader;
    Orchestrator orch(opts, drafter, grader);
    version = orch.run(config_for(tree)).version;
  }
  Store::Options ro;
  ro.path = opts.path;
  ro.read_only = true;
  Store reopened(ro);
  auto rv = reopened.report_version(version);
  ASSERT_TRUE(rv);
  EXPECT_NE(rv->content.find("[calc.py:1-3]"), std::string::npos);
}

TEST(RevisionPrompt, ListsIssuesUpToTheCap) {
  EXPECT_EQ(revision_prompt("Brief", {}), "Brief");
  std::vector<Issue> issues = {
    {Severity::High, "first", "cite it"},
    {Severity::Medium, "second", ""},
    {Severity::Low, "third", ""},
  };
  auto p = revision_prompt("Brief", issues, 2);
  EXPECT_EQ(p.rfind("Brief\n\n", 0), 0u);
  EXPECT_NE(p.find("- [high] first (cite it)\n"), std::string::npos);
  EXPECT_NE(p.find("- [medium] second\n"), std::string::npos);
  EXPECT_EQ(p.find("third"), std::string::npos);
  EXPECT_NE(p.find("- (1 more)"), std::string::npos);
}
