#pragma once
#include "coverage.hpp"
#include "ingest.hpp"
#include "retrieval.hpp"
#include "store.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

class Drafter;
class Grader;
class Summarizer;
class TextEncoder;

enum class PipelineState {
  Ingesting, Drafting, EnforcingCitations, Verifying, Scoring, GatePass, Revising, Done
};

const char* to_string(PipelineState s);

// Checked before every drafting attempt.
class CancellationToken {
public:
  void cancel() { flag_.store(true); }
  bool cancelled() const { return flag_.load(); }
private:
  std::atomic<bool> flag_{false};
};

struct PipelineConfig {
  std::string root;
  std::string brief;
  CoverageGate gate;
  int max_iters = 3;
  int evidence_limit = 20;
  int expected_items = 0;               // 0: number of ingested files
  bool summarize = true;                // only when a summarizer is given
  bool chunk_summaries = false;
  bool fallback_to_first_chunk = true;
  RetrievalOptions retrieval;
  IngestOptions ingest;
  bool quiet = false;
};

struct PipelineResult {
  std::string report;
  int64_t version = 0;
  IterationMetrics metrics;
  std::vector<Issue> issues;
  std::vector<Claim> claims;
  int iterations = 0;
  IngestStats ingest;
};

// Runs one report end to end over the store it owns:
// INGESTING -> DRAFTING -> ENFORCING_CITATIONS -> VERIFYING -> SCORING
// -> GATE_PASS, or REVISING and back to DRAFTING until max_iters.
class Orchestrator {
public:
  Orchestrator(const Store::Options& store_opts, Drafter& drafter, Grader& grader,
               Summarizer* summarizer = nullptr, TextEncoder* encoder = nullptr);

  // Throws EvidenceError, GateExhaustedError, CancelledError, and whatever
  // the drafter throws.
  PipelineResult run(const PipelineConfig& config, const CancellationToken& cancel = CancellationToken());

  PipelineState state() const { return state_; }
  const Store& store() const { return *store_; }

private:
  void enter(PipelineState s, int iteration, bool quiet);

  std::unique_ptr<Store> store_;
  Drafter& drafter_;
  Grader& grader_;
  Summarizer* summarizer_;
  TextEncoder* encoder_;
  PipelineState state_ = PipelineState::Ingesting;
};

// The brief followed by the issues the next draft must address.
std::string revision_prompt(const std::string& brief, const std::vector<Issue>& issues, size_t max_issues = 20);
