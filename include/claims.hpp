#pragma once
#include "retrieval.hpp"
#include "store.hpp"
#include <set>
#include <string>
#include <vector>

class Grader;

// Non-blank, non-header lines that are bullets or carry at least five words.
bool is_claim_line(const std::string& line);

// Claims start as missing/medium; only well-formed citations are kept.
std::vector<Claim> extract_claims(const std::string& report, int64_t report_version);

// supported -> low, uncertain -> medium, contradicted/missing -> high
Severity severity_for(ClaimStatus status);

struct VerifyOptions {
  std::set<std::string> disallowed;
  int retrieval_limit = 5;
};

// Re-validates citations, grades each claim against its evidence and falls
// back to retrieval on the claim text when nothing resolves. Grader failures
// become "uncertain".
Claim verify_claim(const Store& store, const Retriever& retriever, Grader& grader,
                   Claim claim, const VerifyOptions& opts = VerifyOptions());

std::vector<Claim> verify_claims(const Store& store, const Retriever& retriever, Grader& grader,
                                 std::vector<Claim> claims, const VerifyOptions& opts = VerifyOptions());

int count_uncited(const std::vector<Claim>& claims);
