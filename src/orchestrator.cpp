#include "orchestrator.hpp"
#include "claims.hpp"
#include "collaborators.hpp"
#include "enforcement.hpp"
#include "errors.hpp"
#include "summarize.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

const char* to_string(PipelineState s) {
  switch (s) {
    case PipelineState::Ingesting: return "INGESTING";
    case PipelineState::Drafting: return "DRAFTING";
    case PipelineState::EnforcingCitations: return "ENFORCING_CITATIONS";
    case PipelineState::Verifying: return "VERIFYING";
    case PipelineState::Scoring: return "SCORING";
    case PipelineState::GatePass: return "GATE_PASS";
    case PipelineState::Revising: return "REVISING";
    case PipelineState::Done: return "DONE";
  }
  return "?";
}

std::string revision_prompt(const std::string& brief, const std::vector<Issue>& issues, size_t max_issues) {
  if (issues.empty()) return brief;
  std::string out = brief;
  out += "\n\nThe previous draft did not pass review. Address these issues:\n";
  size_t n = 0;
  for (auto& i : issues) {
    if (n++ == max_issues) {
      out += "- (" + std::to_string(issues.size() - max_issues) + " more)\n";
      break;
    }
    out += "- [" + std::string(to_string(i.severity)) + "] " + i.description;
    if (!i.fix_hint.empty()) out += " (" + i.fix_hint + ")";
    out += "\n";
  }
  return out;
}

namespace {

std::string with_allowed(const std::string& prompt, const std::vector<std::string>& allowed) {
  std::string out = prompt + "\n\nCite only these citations:\n";
  for (auto& a : allowed) out += "[" + a + "]\n";
  return out;
}

} // namespace

Orchestrator::Orchestrator(const Store::Options& store_opts, Drafter& drafter, Grader& grader,
                           Summarizer* summarizer, TextEncoder* encoder)
  : store_(new Store(store_opts)), drafter_(drafter), grader_(grader),
    summarizer_(summarizer), encoder_(encoder) {}

void Orchestrator::enter(PipelineState s, int iteration, bool quiet) {
  state_ = s;
  if (quiet) return;
  std::cerr << "pipeline: " << to_string(s);
  if (iteration > 0) std::cerr << " (iteration " << iteration << ")";
  std::cerr << "\n";
}

PipelineResult Orchestrator::run(const PipelineConfig& config, const CancellationToken& cancel) {
  if (config.max_iters < 1) throw std::invalid_argument("max_iters must be at least 1");
  Store& store = *store_;
  PipelineResult result;

  enter(PipelineState::Ingesting, 0, config.quiet);
  IngestOptions iopts = config.ingest;
  iopts.quiet = config.quiet;
  result.ingest = ingest_repo(config.root, store, iopts, encoder_);
  if (config.summarize && summarizer_) {
    SummarizeOptions sopts;
    sopts.chunk_level = config.chunk_summaries;
    sopts.quiet = config.quiet;
    std::string name = fs::path(config.root).lexically_normal().filename().string();
    if (name.empty() || name == ".") name = fs::absolute(config.root).lexically_normal().parent_path().filename().string();
    summarize_repo(store, *summarizer_, name, sopts);
  }
  int expected = config.expected_items > 0 ? config.expected_items : (int)store.files().size();

  Retriever retriever(store, encoder_, config.retrieval);
  std::string prompt = config.brief;
  // one version per run, rewritten by every iteration
  ReportVersion rv;

  for (int iter = 1; iter <= config.max_iters; ++iter) {
    if (cancel.cancelled()) throw CancelledError("run cancelled before iteration " + std::to_string(iter));

    enter(PipelineState::Drafting, iter, config.quiet);
    EvidenceBundle bundle = retriever.retrieve(prompt, config.evidence_limit);
    if (bundle.empty()) throw EvidenceError("no evidence found for: " + config.brief);
    auto allowed = allowed_citations(bundle, store);
    std::string draft = drafter_.draft(with_allowed(prompt, allowed), evidence_blocks(bundle, store));

    enter(PipelineState::EnforcingCitations, iter, config.quiet);
    EnforceOptions eopts;
    eopts.allowed = allowed;
    eopts.fallback_to_first_chunk = config.fallback_to_first_chunk;
    EnforceStats estats;
    std::string report = enforce_citations(draft, store, retriever, eopts, &estats);
    validate_report_citations(report, store);
    if (!config.quiet) {
      std::cerr << "pipeline: citations appended to " << estats.lines_cited << " lines, "
                << estats.citations_dropped << " dropped, " << estats.lines_uncited << " lines left uncited\n";
    }

    rv.content = report;
    if (rv.id == 0) {
      rv.created_at = utc_timestamp();
      rv.id = store.add_report_version(rv);
    } else {
      store.update_report_version(rv);
    }
    store.log_retrieval_event(rv.id, iter, prompt, bundle.chunks, bundle.summaries, bundle.symbols, bundle.edges);

    enter(PipelineState::Verifying, iter, config.quiet);
    auto claims = verify_claims(store, retriever, grader_, extract_claims(report, rv.id));
    if (count_uncited(claims) > 0) {
      int repaired = repair_uncited_claims(report, claims, store, retriever, eopts);
      if (repaired > 0) {
        validate_report_citations(report, store);
        claims = verify_claims(store, retriever, grader_, extract_claims(report, rv.id));
        if (!config.quiet) std::cerr << "pipeline: repaired " << repaired << " uncited claims\n";
      }
    }

    enter(PipelineState::Scoring, iter, config.quiet);
    CoverageResult coverage = assess_coverage(claims, expected);
    auto issues = plan_issues(coverage, claims);
    IterationMetrics metrics = metrics_for(iter, coverage, claims);
    {
      Store::Transaction tx(store);
      auto ids = store.replace_claims(rv.id, claims);
      for (size_t i = 0; i < ids.size() && i < claims.size(); ++i) claims[i].id = ids[i];
      rv.content = report;
      rv.coverage_score = metrics.coverage;
      rv.citation_score = metrics.citation_rate;
      rv.issues_high = metrics.issues_high;
      rv.issues_med = metrics.issues_med;
      rv.issues_low = metrics.issues_low;
      store.update_report_version(rv);
      store.log_iteration_status(rv.id, metrics);
      store.log_iteration_issues(rv.id, iter, issues);
      tx.commit();
    }
    if (!config.quiet) std::cerr << "pipeline: " << metrics.describe() << "\n";

    result.report = report;
    result.version = rv.id;
    result.metrics = metrics;
    result.issues = issues;
    result.claims = claims;
    result.iterations = iter;

    if (!should_continue(config.gate, coverage, claims)) {
      enter(PipelineState::GatePass, iter, config.quiet);
      enter(PipelineState::Done, 0, config.quiet);
      return result;
    }
    enter(PipelineState::Revising, iter, config.quiet);
    prompt = revision_prompt(config.brief, issues);
  }
  throw GateExhaustedError(config.max_iters, result.metrics);
}
