#pragma once
#include "store.hpp"
#include <optional>
#include <string>
#include <vector>

class Summarizer;

// Summary text must be non-empty and carry at least one citation; every
// citation must parse and resolve. Throws FormatError or CitationError.
void validate_summary(const Summary& summary, const Store& store);

// One chunk-level summary per chunk of the file.
std::vector<Summary> summarize_chunks(Store& store, Summarizer& summarizer, int64_t file_id);

// nullopt when the file has no chunks or the summarizer failed.
std::optional<Summary> summarize_file(Store& store, Summarizer& summarizer, int64_t file_id);

// Reduces child summaries. Citations are inherited from the children.
std::optional<Summary> summarize_module(Store& store, Summarizer& summarizer, int64_t module_id,
                                        const std::string& module_path, const std::vector<Summary>& children);
std::optional<Summary> summarize_package(Store& store, Summarizer& summarizer, int64_t package_id,
                                         const std::string& package_path, const std::vector<Summary>& children);

struct SummarizeOptions {
  bool chunk_level = false;  // also summarize every chunk
  bool quiet = false;
};

struct SummaryTree {
  std::vector<Summary> chunks;
  std::vector<Summary> files;
  std::vector<Summary> modules;
  std::optional<Summary> package;
  int skipped = 0;
};

// Parsed files, then one module per directory, then one package for the root.
SummaryTree summarize_repo(Store& store, Summarizer& summarizer, const std::string& root_name,
                           const SummarizeOptions& opts = SummarizeOptions());
