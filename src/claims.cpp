#include "claims.hpp"
#include "citation.hpp"
#include "collaborators.hpp"
#include "text_util.hpp"
#include <re2/re2.h>
#include <iostream>
#include <sstream>

bool is_claim_line(const std::string& line) {
  static const RE2 bullet("^(?:[-*+]|\\d+[.)])\\s+\\S.*");
  std::string t = trim(line);
  if (t.empty() || t[0] == '#') return false;
  if (RE2::FullMatch(t, bullet)) return true;
  std::istringstream words(t);
  std::string w;
  int n = 0;
  while (words >> w) ++n;
  return n >= 5;
}

std::vector<Claim> extract_claims(const std::string& report, int64_t report_version) {
  std::vector<Claim> out;
  for (auto& line : split_lines(report)) {
    if (!is_claim_line(line)) continue;
    Claim c;
    c.report_version = report_version;
    c.text = trim(line);
    c.citation_refs = extract_citations(c.text);
    c.status = ClaimStatus::Missing;
    c.severity = Severity::Medium;
    c.rationale = "not checked";
    out.push_back(std::move(c));
  }
  return out;
}

Severity severity_for(ClaimStatus status) {
  switch (status) {
    case ClaimStatus::Supported: return Severity::Low;
    case ClaimStatus::Uncertain: return Severity::Medium;
    case ClaimStatus::Contradicted:
    case ClaimStatus::Missing: return Severity::High;
  }
  return Severity::High;
}

namespace {

GradeResult safe_grade(Grader& grader, const std::string& claim, const std::string& evidence) {
  try {
    GradeResult g = grader.grade(claim, evidence);
    if (g.status == ClaimStatus::Missing) g.status = ClaimStatus::Uncertain;
    return g;
  } catch (const std::exception& e) {
    std::cerr << "warning: grading failed, marking uncertain: " << e.what() << "\n";
    return GradeResult{ClaimStatus::Uncertain, std::string("grader failed: ") + e.what()};
  }
}

bool decisive(ClaimStatus s) {
  return s == ClaimStatus::Supported || s == ClaimStatus::Contradicted;
}

} // namespace

Claim verify_claim(const Store& store, const Retriever& retriever, Grader& grader,
                   Claim claim, const VerifyOptions& opts) {
  std::vector<std::string> kept;
  std::vector<Chunk> evidence;
  for (auto& ref : claim.citation_refs) {
    if (opts.disallowed.count(ref)) continue;
    auto parsed = try_parse_citation(ref);
    if (!parsed) continue;
    auto r = resolve_citation(*parsed, store);
    if (!r.ok()) continue;
    kept.push_back(ref);
    evidence.push_back(*r.chunk);
  }
  claim.citation_refs = kept;

  if (!evidence.empty()) {
    claim.status = ClaimStatus::Uncertain;
    claim.rationale = "no decisive verdict from cited evidence";
    for (size_t i = 0; i < evidence.size(); ++i) {
      GradeResult g = safe_grade(grader, claim.text, evidence[i].text);
      if (!g.rationale.empty()) claim.rationale = g.rationale;
      if (decisive(g.status)) {
        claim.status = g.status;
        break;
      }
    }
  } else {
    claim.status = ClaimStatus::Missing;
    claim.rationale = "no resolvable citation";
    auto bundle = retriever.retrieve(claim.text, opts.retrieval_limit);
    for (auto& c : bundle.chunks) {
      auto f = store.file_by_id(c.file_id);
      if (!f) continue;
      std::string cite = cite_chunk(c, f->path);
      if (opts.disallowed.count(cite)) continue;
      GradeResult g = safe_grade(grader, claim.text, c.text);
      if (!decisive(g.status)) continue;
      claim.status = g.status;
      claim.citation_refs.push_back(cite);
      claim.rationale = g.rationale.empty() ? "graded via retrieval " + cite : g.rationale;
      break;
    }
  }
  claim.severity = severity_for(claim.status);
  return claim;
}

std::vector<Claim> verify_claims(const Store& store, const Retriever& retriever, Grader& grader,
                                 std::vector<Claim> claims, const VerifyOptions& opts) {
  for (auto& c : claims) c = verify_claim(store, retriever, grader, std::move(c), opts);
  return claims;
}

int count_uncited(const std::vector<Claim>& claims) {
  int n = 0;
  for (auto& c : claims) if (c.citation_refs.empty()) ++n;
  return n;
}
