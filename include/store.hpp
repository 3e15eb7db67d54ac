#pragma once
#include "models.hpp"
#include <optional>
#include <string>
#include <vector>

struct IterationStatusRow {
  int64_t report_version = 0;
  IterationMetrics metrics;
  std::string created_at;
};

struct IterationIssueRow {
  int64_t report_version = 0;
  int iteration = 0;
  Issue issue;
  std::string created_at;
};

struct RetrievalEventRow {
  int64_t id = 0;
  int64_t report_version = 0;
  int iteration = 0;
  std::string prompt;
  std::string chunks_json;
  std::string created_at;
};

// SQLite-backed knowledge base. One connection, one owner.
class Store {
public:
  struct Options {
    std::string path;            // empty: ephemeral temp file
    bool persist = false;        // keep the file on close
    bool allow_existing = false; // reuse a file that already exists
    bool read_only = false;      // audit access; implies allow_existing
  };

  Store();                       // ephemeral, deleted on close
  explicit Store(const Options& opts);
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  void close();
  const std::string& path() const;

  // Savepoint scope. Rolls back unless commit() was called.
  class Transaction {
  public:
    explicit Transaction(Store& store);
    ~Transaction();
    void commit();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
  private:
    Store& store_;
    std::string name_;
    bool done_;
  };

  // files
  int64_t add_file(const FileRecord& f);
  void update_file(const FileRecord& f);
  void clear_file_contents(int64_t file_id);
  std::optional<FileRecord> file_by_path(const std::string& path) const;
  std::optional<FileRecord> file_by_id(int64_t id) const;
  std::vector<FileRecord> files() const;

  // chunks
  std::vector<int64_t> add_chunks(const std::vector<Chunk>& chunks);
  std::optional<Chunk> chunk_by_id(int64_t id) const;
  std::vector<Chunk> chunks_for_file(int64_t file_id) const;
  std::vector<Chunk> chunks_for_symbol(int64_t symbol_id) const;
  std::vector<Chunk> chunks_of_kind(const std::string& kind, int limit) const;
  std::optional<Chunk> first_chunk() const;
  std::optional<Chunk> find_chunk_covering(int64_t file_id, int start, int end) const;
  std::vector<Chunk> search_chunks(const std::string& query, int limit) const;
  int64_t chunk_count() const;

  // symbols & edges
  std::vector<int64_t> add_symbols(const std::vector<Symbol>& symbols);
  void set_symbol_parent(int64_t symbol_id, std::optional<int64_t> parent_id);
  std::optional<Symbol> symbol_by_id(int64_t id) const;
  std::vector<Symbol> symbols_for_file(int64_t file_id) const;
  std::vector<Symbol> symbols() const;
  std::vector<Symbol> search_symbols(const std::string& fragment, int limit,
                                     bool include_imports = false) const;
  void add_edges(const std::vector<Edge>& edges);   // duplicates ignored
  std::vector<Edge> edges_for_symbol(int64_t symbol_id) const;
  int64_t edge_count() const;
  void add_pending_edges(const std::vector<PendingEdge>& edges);   // duplicates ignored
  std::vector<PendingEdge> pending_edges() const;

  // modules, packages, summaries
  int64_t add_package(const std::string& path, const std::string& name);
  int64_t add_module(const std::string& path, const std::string& name,
                     std::optional<int64_t> package_id);
  void link_module_file(int64_t module_id, int64_t file_id);
  std::vector<int64_t> files_for_module(int64_t module_id) const;
  std::vector<int64_t> modules_for_package(int64_t package_id) const;
  int64_t add_summary(const Summary& s);
  // Drops earlier summaries of the same level and target first.
  int64_t replace_summary(const Summary& s);
  std::vector<Summary> summaries(std::optional<SummaryLevel> level = std::nullopt) const;
  std::vector<Summary> search_summaries(const std::string& query, int limit) const;

  // reports & claims
  int64_t add_report_version(const ReportVersion& rv);
  void update_report_version(const ReportVersion& rv);
  std::optional<ReportVersion> report_version(int64_t id) const;
  std::vector<ReportVersion> report_versions() const;
  std::vector<int64_t> replace_claims(int64_t report_version, const std::vector<Claim>& claims);
  std::vector<Claim> claims_for_report(int64_t report_version) const;

  // embeddings
  void add_chunk_embeddings(const std::vector<Embedding>& e);
  void add_symbol_embeddings(const std::vector<Embedding>& e);
  std::vector<Embedding> chunk_embeddings() const;
  bool has_chunk_embeddings() const;

  // audit log
  int64_t log_retrieval_event(int64_t report_version, int iteration, const std::string& prompt,
                              const std::vector<Chunk>& chunks,
                              const std::vector<Summary>& summaries,
                              const std::vector<Symbol>& symbols,
                              const std::vector<Edge>& edges);
  std::vector<RetrievalEventRow> retrieval_events(std::optional<int64_t> report_version) const;
  void log_iteration_status(int64_t report_version, const IterationMetrics& m);
  void log_iteration_issues(int64_t report_version, int iteration, const std::vector<Issue>& issues);
  std::vector<IterationStatusRow> iteration_status(std::optional<int64_t> report_version) const;
  std::vector<IterationIssueRow> iteration_issues(std::optional<int64_t> report_version) const;

private:
  struct Impl;
  Impl* impl_;
};
