#include "audit.hpp"
#include "errors.hpp"
#include <fstream>
#include <iomanip>

namespace {

int64_t need(const std::optional<int64_t>& v, const char* flag, const std::string& command) {
  if (!v) throw FormatError(command + " requires " + flag);
  return *v;
}

std::string clip(const std::string& s, size_t n = 80) {
  std::string out = s.size() > n ? s.substr(0, n) : s;
  for (auto& c : out) if (c == '\n' || c == '\t') c = ' ';
  return out;
}

std::string joined(const std::vector<std::string>& v) {
  std::string out;
  for (auto& s : v) out += (out.empty() ? "" : ", ") + s;
  return out;
}

} // namespace

const std::vector<std::string>& audit_commands() {
  static const std::vector<std::string> cmds = {
    "list-files", "list-reports", "show-report", "export-report", "list-claims",
    "list-symbols", "list-summaries", "search-chunks", "symbol-neighbors",
    "list-retrieval-events", "list-iterations", "list-issues",
  };
  return cmds;
}

int run_audit(const Store& store, const AuditRequest& req, std::ostream& os) {
  const std::string& cmd = req.command;
  os << std::fixed << std::setprecision(2);

  if (cmd == "list-files") {
    for (auto& f : store.files()) {
      os << f.id << "\t" << f.path << "\t" << f.lang << (f.parsed ? "" : "\tunparsed") << "\n";
    }
    return 0;
  }
  if (cmd == "list-reports") {
    for (auto& r : store.report_versions()) {
      os << "id=" << r.id << " created=" << r.created_at << " coverage=" << r.coverage_score
         << " citations=" << r.citation_score << " issues(high/med/low)=" << r.issues_high << "/"
         << r.issues_med << "/" << r.issues_low << "\n";
    }
    return 0;
  }
  if (cmd == "show-report" || cmd == "export-report") {
    auto r = store.report_version(need(req.id, "--id", cmd));
    if (!r) {
      os << "Not found\n";
      return 1;
    }
    if (cmd == "show-report") {
      os << r->content << "\n";
      return 0;
    }
    if (req.out.empty()) throw FormatError("export-report requires --out");
    std::ofstream out(req.out);
    if (!out) throw std::runtime_error("cannot write " + req.out);
    out << r->content;
    os << "Wrote report " << r->id << " to " << req.out << "\n";
    return 0;
  }
  if (cmd == "list-claims") {
    for (auto& c : store.claims_for_report(need(req.report_id, "--report-id", cmd))) {
      os << "id=" << c.id << " status=" << to_string(c.status) << " severity=" << to_string(c.severity)
         << " citations=[" << joined(c.citation_refs) << "] text=" << c.text << "\n";
    }
    return 0;
  }
  if (cmd == "list-symbols") {
    auto syms = req.file_id ? store.symbols_for_file(*req.file_id) : store.symbols();
    for (auto& s : syms) {
      os << "id=" << s.id << " file=" << s.file_id << " kind=" << s.kind << " name=" << s.name
         << " [" << s.start_line << "-" << s.end_line << "]";
      if (s.parent_symbol_id) os << " parent=" << *s.parent_symbol_id;
      os << "\n";
    }
    return 0;
  }
  if (cmd == "list-summaries") {
    std::optional<SummaryLevel> level;
    if (!req.level.empty()) level = summary_level_from_string(req.level);
    for (auto& s : store.summaries(level)) {
      os << "id=" << s.id << " level=" << to_string(s.level) << " target=" << s.target_id
         << " conf=" << s.confidence << " text=" << clip(s.text) << "\n";
    }
    return 0;
  }
  if (cmd == "search-chunks") {
    if (req.query.empty()) throw FormatError("search-chunks requires --query");
    for (auto& c : store.search_chunks(req.query, req.limit)) {
      os << "id=" << c.id << " file=" << c.file_id << " [" << c.start_line << "-" << c.end_line << "] "
         << clip(c.text) << "\n";
    }
    return 0;
  }
  if (cmd == "symbol-neighbors") {
    int64_t id = need(req.symbol_id, "--symbol-id", cmd);
    std::optional<EdgeType> only;
    if (!req.edge_type.empty()) only = edge_type_from_string(req.edge_type);
    for (auto& e : store.edges_for_symbol(id)) {
      if (only && e.type != *only) continue;
      os << e.src_symbol_id << " -[" << to_string(e.type) << "]-> " << e.dst_symbol_id << "\n";
    }
    return 0;
  }
  if (cmd == "list-retrieval-events") {
    for (auto& e : store.retrieval_events(req.report_id)) {
      os << "id=" << e.id << " report=" << e.report_version << " iter=" << e.iteration
         << " created=" << e.created_at << " prompt=" << clip(e.prompt) << "\n";
    }
    return 0;
  }
  if (cmd == "list-iterations") {
    for (auto& r : store.iteration_status(req.report_id)) {
      const auto& m = r.metrics;
      os << "report=" << r.report_version << " iter=" << m.iteration << " cov=" << m.coverage
         << " support=" << m.support_rate << " cite=" << m.citation_rate << " issues(high/med/low)="
         << m.issues_high << "/" << m.issues_med << "/" << m.issues_low
         << " missing_citations=" << m.missing_citations << " created=" << r.created_at << "\n";
    }
    return 0;
  }
  if (cmd == "list-issues") {
    for (auto& r : store.iteration_issues(req.report_id)) {
      os << "report=" << r.report_version << " iter=" << r.iteration << " severity="
         << to_string(r.issue.severity) << " desc=" << r.issue.description;
      if (!r.issue.fix_hint.empty()) os << " hint=" << r.issue.fix_hint;
      os << " created=" << r.created_at << "\n";
    }
    return 0;
  }
  throw FormatError("unknown audit command: " + cmd);
}
