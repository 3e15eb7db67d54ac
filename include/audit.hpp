#pragma once
#include "store.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

struct AuditRequest {
  std::string command;
  std::optional<int64_t> id;
  std::optional<int64_t> report_id;
  std::optional<int64_t> file_id;
  std::optional<int64_t> symbol_id;
  std::string level;
  std::string query;
  std::string edge_type;
  std::string out;        // export-report target
  int limit = 20;
};

const std::vector<std::string>& audit_commands();

// Read-only queries over a persisted store, one line per row on `os`.
// Returns a process exit code; FormatError for a missing or bad argument.
int run_audit(const Store& store, const AuditRequest& req, std::ostream& os);
