#include "models.hpp"
#include "errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

const char* to_string(ClaimStatus s) {
  switch (s) {
    case ClaimStatus::Supported: return "supported";
    case ClaimStatus::Contradicted: return "contradicted";
    case ClaimStatus::Uncertain: return "uncertain";
    case ClaimStatus::Missing: return "missing";
  }
  return "missing";
}

const char* to_string(Severity s) {
  switch (s) {
    case Severity::High: return "high";
    case Severity::Medium: return "medium";
    case Severity::Low: return "low";
  }
  return "medium";
}

const char* to_string(SummaryLevel l) {
  switch (l) {
    case SummaryLevel::Chunk: return "chunk";
    case SummaryLevel::File: return "file";
    case SummaryLevel::Module: return "module";
    case SummaryLevel::Package: return "package";
  }
  return "file";
}

const char* to_string(EdgeType t) {
  switch (t) {
    case EdgeType::Imports: return "imports";
    case EdgeType::ImportsResolved: return "imports-resolved";
    case EdgeType::Calls: return "calls";
    case EdgeType::Inherits: return "inherits";
    case EdgeType::MemberOf: return "member-of";
    case EdgeType::Implements: return "implements";
    case EdgeType::Exports: return "exports";
  }
  return "calls";
}

ClaimStatus claim_status_from_string(const std::string& s) {
  if (s == "supported") return ClaimStatus::Supported;
  if (s == "contradicted") return ClaimStatus::Contradicted;
  if (s == "uncertain") return ClaimStatus::Uncertain;
  if (s == "missing") return ClaimStatus::Missing;
  throw FormatError("unknown claim status: " + s);
}

Severity severity_from_string(const std::string& s) {
  if (s == "high") return Severity::High;
  if (s == "medium") return Severity::Medium;
  if (s == "low") return Severity::Low;
  throw FormatError("unknown severity: " + s);
}

SummaryLevel summary_level_from_string(const std::string& s) {
  if (s == "chunk") return SummaryLevel::Chunk;
  if (s == "file") return SummaryLevel::File;
  if (s == "module") return SummaryLevel::Module;
  if (s == "package") return SummaryLevel::Package;
  throw FormatError("unknown summary level: " + s);
}

EdgeType edge_type_from_string(const std::string& s) {
  if (s == "imports") return EdgeType::Imports;
  if (s == "imports-resolved") return EdgeType::ImportsResolved;
  if (s == "calls") return EdgeType::Calls;
  if (s == "inherits") return EdgeType::Inherits;
  if (s == "member-of") return EdgeType::MemberOf;
  if (s == "implements") return EdgeType::Implements;
  if (s == "exports") return EdgeType::Exports;
  throw FormatError("unknown edge type: " + s);
}

std::string IterationMetrics::describe() const {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2)
     << "iteration=" << iteration
     << " coverage=" << coverage
     << " support_rate=" << support_rate
     << " citation_rate=" << citation_rate
     << " missing_citations=" << missing_citations
     << " issues_high=" << issues_high
     << " issues_med=" << issues_med
     << " issues_low=" << issues_low;
  return os.str();
}

std::string utc_timestamp() {
  return format_utc(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

std::string format_utc(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return os.str();
}

CitationError::CitationError(CitationFailure r, const std::string& c)
  : std::runtime_error(std::string(r == CitationFailure::UnknownFile
                                       ? "citation references unknown file: "
                                       : "citation range not found in file: ") + c),
    reason(r), citation(c) {}

GateExhaustedError::GateExhaustedError(int max_iters, const IterationMetrics& last)
  : std::runtime_error("gating failed after " + std::to_string(max_iters) +
                       " attempts: " + last.describe()),
    metrics(last) {}
