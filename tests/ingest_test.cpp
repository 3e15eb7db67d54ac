#include "ingest.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace {

IngestOptions quiet_opts() {
  IngestOptions o;
  o.quiet = true;
  o.workers = 2;
  return o;
}

bool has_edge(const Store& store, int64_t src, int64_t dst, EdgeType t) {
  auto edges = store.edges_for_symbol(src);
  return std::any_of(edges.begin(), edges.end(), [&](const Edge& e) {
    return e.src_symbol_id == src && e.dst_symbol_id == dst && e.type == t;
  });
}

const Symbol* named(const std::vector<Symbol>& syms, const std::string& name, const std::string& kind) {
  for (auto& s : syms) {
    if (s.name == name && s.kind == kind) return &s;
  }
  return nullptr;
}

} // namespace

TEST(Ingest, SingleFunctionFile) {
  TempTree tree;
  tree.write("foo.py", "def foo():\n    return 1\n");
  Store store;
  auto stats = ingest_repo(tree.path(), store, quiet_opts());
  EXPECT_EQ(stats.files_added, 1);

  auto file = store.file_by_path("foo.py");
  ASSERT_TRUE(file);
  EXPECT_TRUE(file->parsed);
  EXPECT_EQ(file->lang, "python");
  EXPECT_EQ(file->hash.size(), 64u);

  auto chunks = store.chunks_for_file(file->id);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].kind, "function");
  EXPECT_EQ(chunks[0].start_line, 1);
  EXPECT_EQ(chunks[0].end_line, 2);

  auto syms = store.symbols_for_file(file->id);
  ASSERT_EQ(syms.size(), 1u);
  EXPECT_EQ(syms[0].name, "foo");
  ASSERT_TRUE(chunks[0].symbol_id);
  EXPECT_EQ(*chunks[0].symbol_id, syms[0].id);
}

TEST(Ingest, UnchangedFilesAreSkippedAndChangedOnesUpdatedInPlace) {
  TempTree tree;
  tree.write("a.py", "def a():\n    return 1\n");
  tree.write("b.py", "def b():\n    return 2\n");
  Store store;
  ingest_repo(tree.path(), store, quiet_opts());
  auto before_a = store.file_by_path("a.py");
  auto before_b = store.file_by_path("b.py");
  ASSERT_TRUE(before_a && before_b);

  tree.write("b.py", "def b():\n    return 2\n\ndef c():\n    return 3\n");
  auto stats = ingest_repo(tree.path(), store, quiet_opts());
  EXPECT_EQ(stats.files_unchanged, 1);
  EXPECT_EQ(stats.files_updated, 1);
  EXPECT_EQ(stats.files_added, 0);

  auto after_a = store.file_by_path("a.py");
  auto after_b = store.file_by_path("b.py");
  EXPECT_EQ(after_a->id, before_a->id);
  EXPECT_EQ(after_a->hash, before_a->hash);
  EXPECT_EQ(after_b->id, before_b->id);
  EXPECT_NE(after_b->hash, before_b->hash);
  EXPECT_EQ(store.chunks_for_file(after_b->id).size(), 2u);
  EXPECT_EQ(store.symbols_for_file(after_b->id).size(), 2u);
  EXPECT_EQ(store.files().size(), 2u);
}

TEST(Ingest, TextAndUnknownFilesFallBackToParagraphsAndBlocks) {
  TempTree tree;
  tree.write("README.md", "# Title\n\nFirst paragraph.\n\nSecond paragraph\nwith two lines.\n");
  tree.write("data.xyz", "alpha\nbeta\n");
  Store store;
  auto stats = ingest_repo(tree.path(), store, quiet_opts());
  EXPECT_EQ(stats.files_unparsed, 2);

  auto md = store.file_by_path("README.md");
  ASSERT_TRUE(md);
  EXPECT_FALSE(md->parsed);
  auto paras = store.chunks_for_file(md->id);
  ASSERT_EQ(paras.size(), 3u);
  EXPECT_EQ(paras[2].start_line, 5);
  EXPECT_EQ(paras[2].end_line, 6);

  auto other = store.file_by_path("data.xyz");
  ASSERT_TRUE(other);
  EXPECT_FALSE(other->parsed);
  auto blocks = store.chunks_for_file(other->id);
  ASSERT_EQ(blocks.size(), 1u);
  EXPECT_EQ(blocks[0].kind, "block");
  EXPECT_TRUE(store.symbols_for_file(other->id).empty());
}

TEST(Ingest, ImportsResolveAcrossFiles) {
  TempTree tree;
  tree.write("app/main.py", "from util import helper\n\ndef run():\n    return helper()\n");
  tree.write("app/util.py", "def helper():\n    return 1\n");
  Store store;
  auto stats = ingest_repo(tree.path(), store, quiet_opts());
  EXPECT_GE(stats.cross_file_edges, 2);

  auto syms = store.symbols();
  auto* imp = named(syms, "helper", "import");
  auto* def = named(syms, "helper", "function");
  auto* run = named(syms, "run", "function");
  ASSERT_TRUE(imp && def && run);
  EXPECT_TRUE(has_edge(store, imp->id, def->id, EdgeType::ImportsResolved));
  EXPECT_TRUE(has_edge(store, run->id, def->id, EdgeType::Calls));
  EXPECT_TRUE(has_edge(store, run->id, imp->id, EdgeType::Imports));

  // running the pass again adds nothing new
  int64_t edges = store.edge_count();
  resolve_cross_file(store);
  EXPECT_EQ(store.edge_count(), edges);
}

TEST(Ingest, CallsIntoAnEditedFileAreRelinked) {
  TempTree tree;
  tree.write("a.py", "from b import helper\n\ndef run():\n    return helper()\n");
  tree.write("b.py", "def helper():\n    return 1\n");
  Store store;
  ingest_repo(tree.path(), store, quiet_opts());

  tree.write("b.py", "def helper():\n    return 2\n\ndef other():\n    return 3\n");
  auto stats = ingest_repo(tree.path(), store, quiet_opts());
  EXPECT_EQ(stats.files_unchanged, 1);
  EXPECT_EQ(stats.files_updated, 1);

  auto syms = store.symbols();
  auto* imp = named(syms, "helper", "import");
  auto* def = named(syms, "helper", "function");
  auto* run = named(syms, "run", "function");
  ASSERT_TRUE(imp && def && run);
  EXPECT_TRUE(has_edge(store, run->id, def->id, EdgeType::Calls));
  EXPECT_TRUE(has_edge(store, imp->id, def->id, EdgeType::ImportsResolved));
}

TEST(Ingest, MaxFilesCapsTheWalk) {
  TempTree tree;
  for (int i = 0; i < 5; ++i) tree.write("m" + std::to_string(i) + ".py", "x = 1\n");
  Store store;
  auto opts = quiet_opts();
  opts.max_files = 3;
  auto stats = ingest_repo(tree.path(), store, opts);
  EXPECT_EQ(stats.files_seen, 3);
  EXPECT_EQ(store.files().size(), 3u);
}

TEST(Ingest, StoresEmbeddingsWhenAnEncoderIsGiven) {
  TempTree tree;
  tree.write("foo.py", "def foo():\n    return 1\n");
  Store store;
  HashEncoder enc;
  ingest_repo(tree.path(), store, quiet_opts(), &enc);
  EXPECT_TRUE(store.has_chunk_embeddings());
  auto e = store.chunk_embeddings();
  ASSERT_EQ(e.size(), 1u);
  EXPECT_EQ(e[0].vector.size(), 32u);
}

TEST(Ingest, EncoderFailureLeavesTheFileIngested) {
  TempTree tree;
  tree.write("foo.py", "def foo():\n    return 1\n");
  Store store;
  HashEncoder enc;
  enc.fail = true;
  auto stats = ingest_repo(tree.path(), store, quiet_opts(), &enc);
  EXPECT_EQ(stats.files_added, 1);
  EXPECT_FALSE(store.has_chunk_embeddings());
  EXPECT_EQ(store.chunk_count(), 1);
}

TEST(Ingest, MissingRootThrows) {
  Store store;
  EXPECT_THROW(ingest_repo("/nonexistent/docgate/root", store, quiet_opts()), std::runtime_error);
}
