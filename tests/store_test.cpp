#include "errors.hpp"
#include "fakes.hpp"
#include "store.hpp"
#include <gtest/gtest.h>
#include <filesystem>

namespace fs = std::filesystem;

TEST(Store, EphemeralFileIsRemovedOnClose) {
  std::string path;
  {
    Store store;
    path = store.path();
    seed_file(store, "a.py", {{1, 2, "function", "def a(): pass"}});
    EXPECT_TRUE(fs::exists(path));
  }
  EXPECT_FALSE(fs::exists(path));
  EXPECT_FALSE(fs::exists(path + "-wal"));
}

TEST(Store, PersistedStoreRefusesSilentReuse) {
  TempTree t;
  Store::Options o;
  o.path = t.file("kb.sqlite");
  o.persist = true;
  {
    Store store(o);
    seed_file(store, "a.py", {{1, 2, "function", "def a(): pass"}});
  }
  ASSERT_TRUE(fs::exists(o.path));
  EXPECT_THROW(Store{o}, StoreError);

  o.allow_existing = true;
  Store again(o);
  ASSERT_EQ(again.files().size(), 1u);
  EXPECT_EQ(again.files()[0].path, "a.py");
}

TEST(Store, ReadOnlyStoreSeesCommittedRows) {
  TempTree t;
  Store::Options o;
  o.path = t.file("kb.sqlite");
  o.persist = true;
  Store writer(o);
  seed_file(writer, "a.py", {{1, 2, "function", "def alpha(): pass"}});

  Store::Options ro;
  ro.path = o.path;
  ro.read_only = true;
  Store reader(ro);
  EXPECT_EQ(reader.files().size(), 1u);
  EXPECT_EQ(reader.search_chunks("alpha", 5).size(), 1u);
  EXPECT_THROW(reader.add_package(".", "x"), StoreError);
}

TEST(Store, SummaryForMissingFileIsAnIntegrityError) {
  Store store;
  Summary s;
  s.level = SummaryLevel::File;
  s.target_id = 4242;
  s.text = "orphan";
  s.created_at = utc_timestamp();
  EXPECT_THROW(store.add_summary(s), IntegrityError);
  EXPECT_TRUE(store.summaries().empty());

  int64_t fid = seed_file(store, "a.py", {{1, 1, "block", "x = 1"}});
  s.target_id = fid;
  EXPECT_GT(store.add_summary(s), 0);

  s.level = SummaryLevel::Module;
  EXPECT_THROW(store.add_summary(s), IntegrityError);
  s.level = SummaryLevel::Package;
  EXPECT_THROW(store.add_summary(s), IntegrityError);
}

TEST(Store, ReplaceSummaryKeepsOnePerTarget) {
  Store store;
  int64_t fid = seed_file(store, "a.py", {{1, 1, "block", "x = 1"}});
  Summary s;
  s.level = SummaryLevel::File;
  s.target_id = fid;
  s.text = "first";
  s.created_at = utc_timestamp();
  store.add_summary(s);
  s.text = "second";
  store.replace_summary(s);
  auto all = store.summaries(SummaryLevel::File);
  ASSERT_EQ(all.size(), 1u);
  EXPECT_EQ(all[0].text, "second");

  // a rejected replacement leaves the earlier summary in place
  s.target_id = 4242;
  EXPECT_THROW(store.replace_summary(s), IntegrityError);
  EXPECT_EQ(store.summaries().size(), 1u);
}

TEST(Store, DanglingReferencesAndBadRangesAreRejected) {
  Store store;
  Chunk c;
  c.file_id = 99;
  c.start_line = 1;
  c.end_line = 2;
  c.kind = "block";
  c.text = "t";
  c.hash = "h";
  EXPECT_THROW(store.add_chunks({c}), IntegrityError);

  int64_t fid = seed_file(store, "a.py", {});
  c.file_id = fid;
  c.start_line = 5;
  c.end_line = 4;
  EXPECT_THROW(store.add_chunks({c}), IntegrityError);
  c.start_line = 0;
  c.end_line = 1;
  EXPECT_THROW(store.add_chunks({c}), IntegrityError);
  EXPECT_EQ(store.chunk_count(), 0);

  Symbol s;
  s.file_id = 77;
  s.name = "f";
  s.kind = "function";
  EXPECT_THROW(store.add_symbols({s}), IntegrityError);
  EXPECT_THROW(store.add_edges({Edge{1000, 1001, EdgeType::Calls}}), IntegrityError);
}

TEST(Store, FailedBatchLeavesNothingBehind) {
  Store store;
  int64_t fid = seed_file(store, "a.py", {});
  Chunk good;
  good.file_id = fid;
  good.start_line = 1;
  good.end_line = 3;
  good.kind = "block";
  good.text = "good";
  good.hash = "g";
  Chunk bad = good;
  bad.start_line = 9;
  bad.end_line = 2;
  EXPECT_THROW(store.add_chunks({good, bad}), IntegrityError);
  EXPECT_TRUE(store.chunks_for_file(fid).empty());
}

TEST(Store, TransactionRollsBackUnlessCommitted) {
  Store store;
  {
    Store::Transaction tx(store);
    seed_file(store, "gone.py", {{1, 1, "block", "x"}});
  }
  EXPECT_FALSE(store.file_by_path("gone.py").has_value());
  {
    Store::Transaction tx(store);
    seed_file(store, "kept.py", {{1, 1, "block", "x"}});
    tx.commit();
  }
  EXPECT_TRUE(store.file_by_path("kept.py").has_value());
}

TEST(Store, FullTextIndexFollowsChunkChanges) {
  Store store;
  int64_t fid = seed_file(store, "a.py", {{1, 3, "function", "def parse_config(): return load()"}});
  ASSERT_EQ(store.search_chunks("parse_config", 5).size(), 1u);

  store.clear_file_contents(fid);
  EXPECT_TRUE(store.search_chunks("parse_config", 5).empty());

  Chunk c;
  c.file_id = fid;
  c.start_line = 1;
  c.end_line = 2;
  c.kind = "function";
  c.text = "def render_page(): pass";
  c.hash = "n";
  store.add_chunks({c});
  EXPECT_EQ(store.search_chunks("render_page", 5).size(), 1u);
  EXPECT_TRUE(store.search_chunks("\"quoted\" AND (weird", 5).empty());
}

TEST(Store, ChunkLookups) {
  Store store;
  int64_t fid = seed_file(store, "m.py", {{1, 10, "class", "class M: ..."}, {3, 5, "method", "def run(self): ..."}});
  auto cover = store.find_chunk_covering(fid, 3, 4);
  ASSERT_TRUE(cover.has_value());
  EXPECT_EQ(cover->start_line, 1);
  EXPECT_FALSE(store.find_chunk_covering(fid, 9, 12).has_value());
  EXPECT_EQ(store.chunks_of_kind("method", 10).size(), 1u);
  EXPECT_EQ(store.first_chunk()->kind, "class");
  for (auto& c : store.chunks_for_file(fid)) EXPECT_GE(c.end_line, c.start_line);
}

TEST(Store, EdgesAreUniqueAndSymbolsSearchable) {
  Store store;
  int64_t fid = seed_file(store, "a.py", {});
  Symbol a, b, imp;
  a.file_id = b.file_id = imp.file_id = fid;
  a.name = "load_config";
  a.kind = "function";
  b.name = "Loader";
  b.kind = "class";
  imp.name = "load_json";
  imp.kind = "import";
  auto ids = store.add_symbols({a, b, imp});
  store.add_edges({{ids[0], ids[1], EdgeType::MemberOf}, {ids[0], ids[1], EdgeType::MemberOf},
                   {ids[0], ids[1], EdgeType::Calls}});
  EXPECT_EQ(store.edge_count(), 2);
  EXPECT_EQ(store.edges_for_symbol(ids[1]).size(), 2u);

  auto found = store.search_symbols("LOAD", 10);
  ASSERT_EQ(found.size(), 2u);
  EXPECT_EQ(store.search_symbols("load", 10, true).size(), 3u);
  EXPECT_TRUE(store.search_symbols("100%", 10).empty());
}

TEST(Store, PendingEdgesIgnoreDuplicatesAndFollowTheirFile) {
  Store store;
  int64_t fid = seed_file(store, "a.py", {});
  Symbol run;
  run.file_id = fid;
  run.name = "run";
  run.kind = "function";
  auto ids = store.add_symbols({run});
  store.add_pending_edges({{ids[0], fid, "helper", EdgeType::Calls},
                           {ids[0], fid, "helper", EdgeType::Calls},
                           {ids[0], fid, "Base", EdgeType::Inherits}});
  auto pending = store.pending_edges();
  ASSERT_EQ(pending.size(), 2u);
  EXPECT_EQ(pending[0].dst_name, "helper");
  EXPECT_EQ(pending[1].type, EdgeType::Inherits);

  store.clear_file_contents(fid);
  EXPECT_TRUE(store.pending_edges().empty());
}

TEST(Store, ReportsAndClaims) {
  Store store;
  ReportVersion rv;
  rv.content = "# Report";
  rv.created_at = utc_timestamp();
  rv.id = store.add_report_version(rv);
  rv.coverage_score = 0.75;
  rv.issues_high = 2;
  store.update_report_version(rv);
  EXPECT_DOUBLE_EQ(store.report_version(rv.id)->coverage_score, 0.75);

  ReportVersion missing = rv;
  missing.id = 999;
  EXPECT_THROW(store.update_report_version(missing), IntegrityError);

  Claim c;
  c.report_version = rv.id;
  c.text = "- does a thing [a.py:1-2]";
  c.citation_refs = {"a.py:1-2", "b.py:3-4"};
  c.status = ClaimStatus::Supported;
  c.severity = Severity::Low;
  c.rationale = "ok";
  store.replace_claims(rv.id, {c, c});
  store.replace_claims(rv.id, {c});
  auto claims = store.claims_for_report(rv.id);
  ASSERT_EQ(claims.size(), 1u);
  EXPECT_EQ(claims[0].citation_refs, c.citation_refs);
  EXPECT_EQ(claims[0].status, ClaimStatus::Supported);

  c.report_version = 555;
  EXPECT_THROW(store.replace_claims(555, {c}), IntegrityError);
}

TEST(Store, EmbeddingsRoundTripAsFloats) {
  Store store;
  int64_t fid = seed_file(store, "a.py", {{1, 1, "block", "x"}});
  auto chunk = store.chunks_for_file(fid).front();
  EXPECT_FALSE(store.has_chunk_embeddings());
  store.add_chunk_embeddings({{chunk.id, {0.5f, -0.25f, 1.0f}}});
  ASSERT_TRUE(store.has_chunk_embeddings());
  auto e = store.chunk_embeddings();
  ASSERT_EQ(e.size(), 1u);
  EXPECT_EQ(e[0].owner_id, chunk.id);
  EXPECT_EQ(e[0].vector, (std::vector<float>{0.5f, -0.25f, 1.0f}));
}

TEST(Store, IterationAuditLog) {
  Store store;
  ReportVersion rv;
  rv.content = "r";
  rv.created_at = utc_timestamp();
  rv.id = store.add_report_version(rv);
  IterationMetrics m;
  m.iteration = 1;
  m.coverage = 0.5;
  m.issues_high = 1;
  store.log_iteration_status(rv.id, m);
  store.log_iteration_issues(rv.id, 1, {Issue{Severity::High, "claim unresolved", "cite it"}});
  store.log_retrieval_event(rv.id, 1, "topic", {}, {}, {}, {});

  auto status = store.iteration_status(rv.id);
  ASSERT_EQ(status.size(), 1u);
  EXPECT_DOUBLE_EQ(status[0].metrics.coverage, 0.5);
  EXPECT_EQ(status[0].metrics.issues_high, 1);
  auto issues = store.iteration_issues(std::nullopt);
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].issue.fix_hint, "cite it");
  EXPECT_EQ(store.retrieval_events(rv.id).size(), 1u);
  EXPECT_TRUE(store.retrieval_events(rv.id + 1).empty());
}
