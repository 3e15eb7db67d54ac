#include "enforcement.hpp"
#include "citation.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <optional>
#include <set>

namespace {

bool passthrough(const std::string& line) {
  std::string t = trim(line);
  return t.empty() || t[0] == '#';
}

class CitationPolicy {
public:
  CitationPolicy(const Store& store, const Retriever& retriever, const EnforceOptions& opts)
    : store_(store), retriever_(retriever), opts_(opts), allowed_(opts.allowed.begin(), opts.allowed.end()) {}

  bool acceptable(const std::string& cite) const {
    if (!allowed_.empty() && !allowed_.count(cite)) return false;
    auto c = try_parse_citation(cite);
    return c && resolve_citation(*c, store_).ok();
  }

  // A citation for an uncited line, or nothing.
  std::optional<std::string> find_for(const std::string& text) const {
    auto bundle = retriever_.retrieve(text, opts_.retrieval_limit);
    for (auto& c : bundle.chunks) {
      auto f = store_.file_by_id(c.file_id);
      if (!f) continue;
      std::string cite = cite_chunk(c, f->path);
      if (acceptable(cite)) return cite;
    }
    if (!opts_.fallback_to_first_chunk) return std::nullopt;
    if (!allowed_.empty()) {
      for (auto& a : opts_.allowed) {
        if (acceptable(a)) return a;
      }
      return std::nullopt;
    }
    auto first = store_.first_chunk();
    if (!first) return std::nullopt;
    auto f = store_.file_by_id(first->file_id);
    if (!f) return std::nullopt;
    return cite_chunk(*first, f->path);
  }

private:
  const Store& store_;
  const Retriever& retriever_;
  const EnforceOptions& opts_;
  std::set<std::string> allowed_;
};

// Text outside a citation group must not open a new one.
std::string literal(std::string s) {
  std::replace(s.begin(), s.end(), '[', '(');
  return s;
}

// Rewrites each [...] group in place, keeping the acceptable parts. Groups
// are delimited the way bracket_tokens finds them.
std::string filter_brackets(const std::string& line, const CitationPolicy& policy, int& kept, int& dropped) {
  std::string out;
  size_t i = 0;
  while (i < line.size()) {
    size_t open = line.find('[', i);
    size_t close = open == std::string::npos ? std::string::npos : line.find(']', open + 1);
    if (close == std::string::npos) {
      out += literal(line.substr(i));
      break;
    }
    out += literal(line.substr(i, open - i));
    if (close == open + 1) {
      out += "[]";
      i = close + 1;
      continue;
    }
    std::vector<std::string> good;
    for (auto& part : split_bracket(line.substr(open + 1, close - open - 1))) {
      if (policy.acceptable(part)) good.push_back(part);
      else ++dropped;
    }
    if (good.empty()) {
      while (!out.empty() && out.back() == ' ') out.pop_back();
    } else {
      std::string joined;
      for (auto& g : good) joined += (joined.empty() ? "" : ", ") + g;
      out += "[" + joined + "]";
      kept += (int)good.size();
    }
    i = close + 1;
  }
  return out;
}

std::string rstrip(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.pop_back();
  return s;
}

} // namespace

std::string enforce_citations(const std::string& report, const Store& store, const Retriever& retriever,
                              const EnforceOptions& opts, EnforceStats* stats) {
  EnforceStats local;
  CitationPolicy policy(store, retriever, opts);
  std::string out;
  auto lines = split_lines(report);
  for (size_t n = 0; n < lines.size(); ++n) {
    std::string line = lines[n];
    if (!passthrough(line)) {
      int kept = 0;
      line = filter_brackets(line, policy, kept, local.citations_dropped);
      if (kept == 0) {
        if (auto cite = policy.find_for(trim(line))) {
          line = rstrip(line) + " [" + *cite + "]";
          ++local.lines_cited;
        } else {
          ++local.lines_uncited;
        }
      }
    }
    if (n) out.push_back('\n');
    out += line;
  }
  if (stats) *stats = local;
  return out;
}

void validate_report_citations(const std::string& report, const Store& store) {
  for (auto& line : split_lines(report)) {
    if (passthrough(line)) continue;
    for (auto& tok : bracket_tokens(line)) {
      for (auto& part : split_bracket(tok)) resolve_or_throw(part, store);
    }
  }
}

int repair_uncited_claims(std::string& report, const std::vector<Claim>& claims, const Store& store,
                          const Retriever& retriever, const EnforceOptions& opts) {
  std::set<std::string> targets;
  for (auto& c : claims) {
    if (c.citation_refs.empty()) targets.insert(c.text);
  }
  if (targets.empty()) return 0;

  CitationPolicy policy(store, retriever, opts);
  auto lines = split_lines(report);
  int changed = 0;
  for (auto& line : lines) {
    std::string t = trim(line);
    if (!targets.count(t)) continue;
    // drop whatever brackets failed verification, then cite afresh
    int kept = 0, dropped = 0;
    std::string base = filter_brackets(line, policy, kept, dropped);
    if (kept > 0) continue;
    auto cite = policy.find_for(trim(base));
    if (!cite) continue;
    line = rstrip(base) + " [" + *cite + "]";
    ++changed;
  }
  if (changed == 0) return 0;
  std::string out;
  for (size_t n = 0; n < lines.size(); ++n) {
    if (n) out.push_back('\n');
    out += lines[n];
  }
  report = out;
  return changed;
}
