#include "summarize.hpp"
#include "citation.hpp"
#include "collaborators.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <sstream>

namespace {

constexpr size_t INHERITED_CITATIONS = 3;

// One line, and no brackets of its own: citations are appended separately.
std::string squash(const std::string& text) {
  std::istringstream in(text);
  std::string word, out;
  while (in >> word) out += (out.empty() ? "" : " ") + word;
  std::replace(out.begin(), out.end(), '[', '(');
  std::replace(out.begin(), out.end(), ']', ')');
  return out;
}

std::string with_citations(const std::string& text, const std::vector<std::string>& cites) {
  if (cites.empty()) return text;
  std::string joined;
  for (auto& c : cites) joined += (joined.empty() ? "" : ", ") + c;
  return text + " [" + joined + "]";
}

// Citations suggested by the summarizer that actually resolve, plus `base`.
std::vector<std::string> grounded(const SummaryResult& r, const std::vector<std::string>& base, const Store& store) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (auto& c : base) {
    if (seen.insert(c).second) out.push_back(c);
  }
  for (auto& c : r.citations) {
    auto parsed = try_parse_citation(c);
    if (!parsed || !resolve_citation(*parsed, store).ok()) continue;
    if (seen.insert(c).second) out.push_back(c);
  }
  return out;
}

std::optional<SummaryResult> ask(Summarizer& summarizer, const std::string& text, const std::string& instructions,
                                 const std::string& what) {
  try {
    SummaryResult r = summarizer.summarize(text, instructions);
    r.text = squash(r.text);
    if (r.text.empty()) {
      std::cerr << "warning: empty summary for " << what << ", skipped\n";
      return std::nullopt;
    }
    r.confidence = std::max(0.0, std::min(1.0, r.confidence));
    return r;
  } catch (const CollaboratorError& e) {
    std::cerr << "warning: summarizing " << what << " failed: " << e.what() << "\n";
    return std::nullopt;
  }
}

Summary store_summary(Store& store, SummaryLevel level, int64_t target, const std::string& text, double confidence) {
  Summary s;
  s.level = level;
  s.target_id = target;
  s.text = text;
  s.confidence = confidence;
  s.created_at = utc_timestamp();
  validate_summary(s, store);
  s.id = store.replace_summary(s);
  return s;
}

std::vector<std::string> inherited(const std::vector<Summary>& children) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (auto& s : children) {
    for (auto& c : extract_citations(s.text)) {
      if (out.size() >= INHERITED_CITATIONS) return out;
      if (seen.insert(c).second) out.push_back(c);
    }
  }
  return out;
}

std::optional<Summary> reduce(Store& store, Summarizer& summarizer, SummaryLevel level, int64_t target,
                              const std::string& path, const std::vector<Summary>& children) {
  auto cites = inherited(children);
  if (cites.empty()) return std::nullopt;
  std::string joined;
  for (auto& c : children) joined += c.text + "\n";
  std::string what = std::string(to_string(level)) + " " + path;
  auto r = ask(summarizer, joined,
               "Combine these summaries into one paragraph describing " + what + ".", what);
  if (!r) return std::nullopt;
  return store_summary(store, level, target, with_citations(r->text, cites), r->confidence);
}

} // namespace

void validate_summary(const Summary& summary, const Store& store) {
  if (trim(summary.text).empty()) throw FormatError("summary text is empty");
  auto tokens = bracket_tokens(summary.text);
  if (tokens.empty()) throw FormatError("summary has no citation");
  for (auto& tok : tokens) {
    for (auto& part : split_bracket(tok)) resolve_or_throw(part, store);
  }
}

std::vector<Summary> summarize_chunks(Store& store, Summarizer& summarizer, int64_t file_id) {
  auto f = store.file_by_id(file_id);
  if (!f) throw std::runtime_error("no file with id " + std::to_string(file_id));
  std::vector<Summary> out;
  for (auto& c : store.chunks_for_file(file_id)) {
    std::string cite = cite_chunk(c, f->path);
    auto r = ask(summarizer, c.text, "Summarize this " + c.kind + " from " + f->path + " in one sentence.", cite);
    if (!r) continue;
    out.push_back(store_summary(store, SummaryLevel::Chunk, c.id,
                                with_citations(r->text, grounded(*r, {cite}, store)), r->confidence));
  }
  return out;
}

std::optional<Summary> summarize_file(Store& store, Summarizer& summarizer, int64_t file_id) {
  auto f = store.file_by_id(file_id);
  if (!f) throw std::runtime_error("no file with id " + std::to_string(file_id));
  auto chunks = store.chunks_for_file(file_id);
  if (chunks.empty()) return std::nullopt;
  std::string joined;
  for (auto& c : chunks) joined += c.text + "\n";
  auto r = ask(summarizer, joined, "Summarize the purpose and main parts of " + f->path + ".", f->path);
  if (!r) return std::nullopt;
  auto cites = grounded(*r, {cite_chunk(chunks.front(), f->path)}, store);
  return store_summary(store, SummaryLevel::File, file_id, with_citations(r->text, cites), r->confidence);
}

std::optional<Summary> summarize_module(Store& store, Summarizer& summarizer, int64_t module_id,
                                        const std::string& module_path, const std::vector<Summary>& children) {
  return reduce(store, summarizer, SummaryLevel::Module, module_id, module_path, children);
}

std::optional<Summary> summarize_package(Store& store, Summarizer& summarizer, int64_t package_id,
                                         const std::string& package_path, const std::vector<Summary>& children) {
  return reduce(store, summarizer, SummaryLevel::Package, package_id, package_path, children);
}

SummaryTree summarize_repo(Store& store, Summarizer& summarizer, const std::string& root_name,
                           const SummarizeOptions& opts) {
  SummaryTree tree;
  int64_t package_id = store.add_package(".", root_name);

  // directory -> (file id, summary)
  std::map<std::string, std::vector<std::pair<int64_t, std::optional<Summary>>>> by_dir;
  for (auto& f : store.files()) {
    if (!f.parsed) continue;
    if (opts.chunk_level) {
      auto cs = summarize_chunks(store, summarizer, f.id);
      tree.chunks.insert(tree.chunks.end(), cs.begin(), cs.end());
    }
    auto s = summarize_file(store, summarizer, f.id);
    if (s) tree.files.push_back(*s);
    else ++tree.skipped;
    auto slash = f.path.rfind('/');
    by_dir[slash == std::string::npos ? "." : f.path.substr(0, slash)].emplace_back(f.id, s);
  }

  for (auto& [dir, entries] : by_dir) {
    auto slash = dir.rfind('/');
    std::string name = dir == "." ? root_name : (slash == std::string::npos ? dir : dir.substr(slash + 1));
    int64_t module_id = store.add_module(dir, name, package_id);
    std::vector<Summary> children;
    for (auto& [file_id, s] : entries) {
      store.link_module_file(module_id, file_id);
      if (s) children.push_back(*s);
    }
    auto m = summarize_module(store, summarizer, module_id, dir, children);
    if (m) tree.modules.push_back(*m);
    else ++tree.skipped;
  }

  tree.package = summarize_package(store, summarizer, package_id, root_name, tree.modules);
  if (!tree.package) ++tree.skipped;
  if (!opts.quiet) {
    std::cerr << "summarize: " << tree.chunks.size() << " chunk, " << tree.files.size() << " file, "
              << tree.modules.size() << " module summaries";
    if (tree.package) std::cerr << ", 1 package summary";
    std::cerr << " (" << tree.skipped << " skipped)\n";
  }
  return tree;
}
