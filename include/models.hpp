#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

enum class ClaimStatus { Supported, Contradicted, Uncertain, Missing };
enum class Severity { High, Medium, Low };
enum class SummaryLevel { Chunk, File, Module, Package };
enum class EdgeType { Imports, ImportsResolved, Calls, Inherits, MemberOf, Implements, Exports };

const char* to_string(ClaimStatus s);
const char* to_string(Severity s);
const char* to_string(SummaryLevel l);
const char* to_string(EdgeType t);

// Inverse mappings; throw FormatError on unknown text.
ClaimStatus claim_status_from_string(const std::string& s);
Severity severity_from_string(const std::string& s);
SummaryLevel summary_level_from_string(const std::string& s);
EdgeType edge_type_from_string(const std::string& s);

struct FileRecord {
  int64_t id = 0;
  std::string path;       // relative to the ingested root, '/' separated
  std::string hash;       // sha256 hex of the raw bytes
  std::string lang;
  int64_t size = 0;
  std::string mtime;      // ISO-8601
  bool parsed = true;     // a structural parser succeeded
};

struct Chunk {
  int64_t id = 0;
  int64_t file_id = 0;
  int start_line = 1;     // 1-indexed, inclusive
  int end_line = 1;
  std::string kind;       // function, method, class, paragraph, block
  std::string text;
  std::string hash;
  std::optional<int64_t> symbol_id;
};

struct Symbol {
  int64_t id = 0;
  int64_t file_id = 0;
  std::string name;
  std::string kind;       // function, method, class, import
  std::string signature;
  int start_line = 1;
  int end_line = 1;
  std::string doc;
  std::optional<int64_t> parent_symbol_id;
};

struct Edge {
  int64_t src_symbol_id = 0;
  int64_t dst_symbol_id = 0;
  EdgeType type = EdgeType::Calls;

  bool operator==(const Edge& o) const {
    return src_symbol_id == o.src_symbol_id && dst_symbol_id == o.dst_symbol_id && type == o.type;
  }
};

// A reference by name to a definition in some other file. Stays in the store
// so every cross-file pass can place it again.
struct PendingEdge {
  int64_t src_symbol_id = 0;
  int64_t file_id = 0;
  std::string dst_name;
  EdgeType type = EdgeType::Calls;
};

struct Summary {
  int64_t id = 0;
  SummaryLevel level = SummaryLevel::File;
  int64_t target_id = 0;
  std::string text;
  double confidence = 0.5;
  std::string created_at;
};

struct Claim {
  int64_t id = 0;
  int64_t report_version = 0;
  std::string text;
  std::vector<std::string> citation_refs;
  ClaimStatus status = ClaimStatus::Missing;
  Severity severity = Severity::Medium;
  std::string rationale;
};

struct ReportVersion {
  int64_t id = 0;
  std::string content;
  std::string created_at;
  double coverage_score = 0.0;
  double citation_score = 0.0;
  int issues_high = 0;
  int issues_med = 0;
  int issues_low = 0;
};

// Owner id is a chunk id or a symbol id depending on the table.
struct Embedding {
  int64_t owner_id = 0;
  std::vector<float> vector;
};

struct Issue {
  Severity severity = Severity::Medium;
  std::string description;
  std::string fix_hint;
};

// Everything the gate looked at in one iteration.
struct IterationMetrics {
  int iteration = 0;
  double coverage = 0.0;
  double support_rate = 0.0;
  double citation_rate = 0.0;
  int missing_citations = 0;
  int issues_high = 0;
  int issues_med = 0;
  int issues_low = 0;

  std::string describe() const;
};

std::string utc_timestamp();
std::string format_utc(std::time_t t);
