#pragma once
#include "models.hpp"
#include <vector>

// Stop/continue thresholds for the revision loop.
struct CoverageGate {
  double min_support_rate = 0.8;
  double min_coverage = 0.8;
  double min_citation_rate = 0.8;
  int max_high_issues = 0;
  int max_medium_issues = 5;
};

struct CoverageResult {
  int expected = 0;
  int covered = 0;

  // Always in [0, 1]; nothing expected counts as fully covered.
  double score() const;
};

// covered = supported claims, expected = caller's estimate
CoverageResult assess_coverage(const std::vector<Claim>& claims, int expected_items);

struct ClaimRates {
  double support_rate = 0.0;
  double citation_rate = 0.0;
  int missing_citations = 0;
  int high = 0;
  int medium = 0;
  int low = 0;
};

// Rates use max(n, 1) as denominator so an empty claim list yields zeros.
ClaimRates claim_rates(const std::vector<Claim>& claims);

// One issue per unsupported claim and one for missing coverage, high first.
std::vector<Issue> plan_issues(const CoverageResult& coverage, const std::vector<Claim>& claims);

// True unless every threshold of the gate is met.
bool should_continue(const CoverageGate& gate, const CoverageResult& coverage, const std::vector<Claim>& claims);

// Severity counts are those of the claims, the same ones the gate checks.
IterationMetrics metrics_for(int iteration, const CoverageResult& coverage, const std::vector<Claim>& claims);
