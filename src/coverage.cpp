#include "coverage.hpp"
#include <algorithm>
#include <sstream>

double CoverageResult::score() const {
  if (expected <= 0) return 1.0;
  double s = (double)covered / (double)expected;
  return std::max(0.0, std::min(1.0, s));
}

CoverageResult assess_coverage(const std::vector<Claim>& claims, int expected_items) {
  CoverageResult r;
  r.expected = std::max(0, expected_items);
  for (auto& c : claims) {
    if (c.status == ClaimStatus::Supported) ++r.covered;
  }
  return r;
}

ClaimRates claim_rates(const std::vector<Claim>& claims) {
  ClaimRates r;
  int supported = 0, cited = 0;
  for (auto& c : claims) {
    if (c.status == ClaimStatus::Supported) ++supported;
    if (c.citation_refs.empty()) ++r.missing_citations;
    else ++cited;
    switch (c.severity) {
      case Severity::High: ++r.high; break;
      case Severity::Medium: ++r.medium; break;
      case Severity::Low: ++r.low; break;
    }
  }
  double n = (double)std::max<size_t>(claims.size(), 1);
  r.support_rate = supported / n;
  r.citation_rate = cited / n;
  return r;
}

static int rank(Severity s) {
  switch (s) {
    case Severity::High: return 0;
    case Severity::Medium: return 1;
    case Severity::Low: return 2;
  }
  return 3;
}

std::vector<Issue> plan_issues(const CoverageResult& coverage, const std::vector<Claim>& claims) {
  std::vector<Issue> issues;
  for (auto& c : claims) {
    if (c.status == ClaimStatus::Supported) continue;
    Issue i;
    i.severity = c.severity == Severity::High ? Severity::High : Severity::Medium;
    i.description = "claim unresolved (" + std::string(to_string(c.status)) + "): " + c.text;
    i.fix_hint = c.citation_refs.empty() ? "cite a chunk that supports this claim, or drop it"
                                         : "check the cited lines; revise the claim or find better evidence";
    issues.push_back(std::move(i));
  }
  if (coverage.score() < 1.0) {
    std::ostringstream d;
    d << "missing coverage: " << coverage.covered << " of " << coverage.expected << " expected items supported";
    issues.push_back(Issue{Severity::Medium, d.str(), "add cited claims for the parts of the code not yet described"});
  }
  std::stable_sort(issues.begin(), issues.end(),
                   [](const Issue& a, const Issue& b) { return rank(a.severity) < rank(b.severity); });
  return issues;
}

bool should_continue(const CoverageGate& gate, const CoverageResult& coverage, const std::vector<Claim>& claims) {
  ClaimRates r = claim_rates(claims);
  bool pass = r.support_rate >= gate.min_support_rate
           && coverage.score() >= gate.min_coverage
           && r.citation_rate >= gate.min_citation_rate
           && r.high <= gate.max_high_issues
           && r.medium <= gate.max_medium_issues;
  return !pass;
}

IterationMetrics metrics_for(int iteration, const CoverageResult& coverage, const std::vector<Claim>& claims) {
  ClaimRates r = claim_rates(claims);
  IterationMetrics m;
  m.iteration = iteration;
  m.coverage = coverage.score();
  m.support_rate = r.support_rate;
  m.citation_rate = r.citation_rate;
  m.missing_citations = r.missing_citations;
  m.issues_high = r.high;
  m.issues_med = r.medium;
  m.issues_low = r.low;
  return m;
}
