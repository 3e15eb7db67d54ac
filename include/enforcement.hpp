#pragma once
#include "retrieval.hpp"
#include "store.hpp"
#include <string>
#include <vector>

struct EnforceOptions {
  std::vector<std::string> allowed;      // empty: any citation that resolves
  bool fallback_to_first_chunk = true;   // when retrieval finds nothing citable
  int retrieval_limit = 3;
};

struct EnforceStats {
  int lines_cited = 0;        // uncited lines that received a citation
  int lines_uncited = 0;      // lines left without one
  int citations_dropped = 0;  // malformed, disallowed or unresolvable
};

// Line by line: headers and blank lines pass through, lines without a
// citation get one appended, cited lines keep only citations that parse,
// are allowed and resolve.
std::string enforce_citations(const std::string& report, const Store& store, const Retriever& retriever,
                              const EnforceOptions& opts, EnforceStats* stats = nullptr);

// Every citation on a non-header line must parse and resolve. Throws
// FormatError or CitationError on the first that does not.
void validate_report_citations(const std::string& report, const Store& store);

// Appends a citation to each report line whose claim ended up uncited.
// Returns the number of lines changed.
int repair_uncited_claims(std::string& report, const std::vector<Claim>& claims, const Store& store,
                          const Retriever& retriever, const EnforceOptions& opts);
