#pragma once
#include "filters.hpp"
#include "store.hpp"
#include <string>
#include <vector>

class TextEncoder;

struct IngestOptions {
  ExclusionRules rules = ExclusionRules::defaults();
  int workers = 4;        // parallel read/hash/parse jobs
  int max_files = 0;      // 0: no cap
  bool quiet = false;
};

struct IngestStats {
  int files_seen = 0;
  int files_added = 0;
  int files_updated = 0;
  int files_unchanged = 0;
  int files_unparsed = 0;
  int chunks = 0;
  int symbols = 0;
  int edges = 0;
  int cross_file_edges = 0;
  int unresolved_edges = 0;
};

// Walks `root`, stores files, chunks, symbols and intra-file edges, then
// runs resolve_cross_file once every file is in.
IngestStats ingest_repo(const std::string& root, Store& store, const IngestOptions& opts,
                        TextEncoder* encoder = nullptr);

struct CrossFileStats {
  int resolved = 0;
  int unresolved = 0;
};

// Second pass over the whole store: links every import symbol to the
// definition it names (imports-resolved) and places every pending edge,
// including those recorded by earlier runs for files that did not change.
CrossFileStats resolve_cross_file(Store& store);
