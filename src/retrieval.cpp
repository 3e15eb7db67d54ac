#include "retrieval.hpp"
#include "citation.hpp"
#include "collaborators.hpp"
#include "errors.hpp"
#include "index.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <tuple>
#include <unordered_map>

namespace {

std::vector<std::string> unique_tokens(const std::string& text) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (auto& t : word_tokens(text, 2)) {
    if (seen.insert(t).second) out.push_back(t);
  }
  return out;
}

// Accumulates additive scores and keeps the chunk rows it has seen.
class Scoreboard {
public:
  explicit Scoreboard(const Store& store) : store_(store) {}

  void add(const Chunk& c, double w) {
    chunks_.emplace(c.id, c);
    scores_[c.id] += w;
  }

  void add_id(int64_t id, double w) {
    if (chunks_.find(id) == chunks_.end()) {
      auto c = store_.chunk_by_id(id);
      if (!c) return;
      chunks_.emplace(id, *c);
    }
    scores_[id] += w;
  }

  std::map<int64_t, double>& scores() { return scores_; }
  const Chunk& chunk(int64_t id) const { return chunks_.at(id); }

private:
  const Store& store_;
  std::unordered_map<int64_t, Chunk> chunks_;
  std::map<int64_t, double> scores_;
};

// Chunks standing for a symbol: attached ones, else the one covering its span.
std::vector<Chunk> symbol_chunks(const Store& store, const Symbol& s) {
  auto out = store.chunks_for_symbol(s.id);
  if (out.empty()) {
    if (auto c = store.find_chunk_covering(s.file_id, s.start_line, s.end_line)) out.push_back(*c);
  }
  return out;
}

std::optional<int64_t> summary_file(const Store& store, const Summary& s) {
  switch (s.level) {
    case SummaryLevel::File:
      return s.target_id;
    case SummaryLevel::Chunk:
      if (auto c = store.chunk_by_id(s.target_id)) return c->file_id;
      return std::nullopt;
    case SummaryLevel::Module: {
      auto files = store.files_for_module(s.target_id);
      if (!files.empty()) return files.front();
      return std::nullopt;
    }
    case SummaryLevel::Package:
      for (auto m : store.modules_for_package(s.target_id)) {
        auto files = store.files_for_module(m);
        if (!files.empty()) return files.front();
      }
      return std::nullopt;
  }
  return std::nullopt;
}

std::vector<std::string> wanted_kinds(const std::vector<std::string>& tokens) {
  std::set<std::string> kinds;
  for (auto& t : tokens) {
    if (t == "function" || t == "functions" || t == "def" || t == "fn" || t == "func") kinds.insert("function");
    if (t == "method" || t == "methods") kinds.insert("method");
    if (t == "class" || t == "classes" || t == "struct" || t == "type" || t == "types") kinds.insert("class");
  }
  return {kinds.begin(), kinds.end()};
}

} // namespace

Retriever::Retriever(const Store& store, TextEncoder* encoder, RetrievalOptions opts)
  : store_(store), encoder_(encoder), opts_(opts) {}

EvidenceBundle Retriever::retrieve(const std::string& topic, int limit) const {
  if (limit <= 0) limit = opts_.limit;
  const auto& w = opts_.weights;
  const int pool = std::max(limit * 2, 10);
  auto tokens = unique_tokens(topic);

  EvidenceBundle bundle;
  Scoreboard board(store_);

  // lexical
  for (auto& c : store_.search_chunks(topic, pool)) board.add(c, w.lexical);

  // vector
  if (encoder_ && store_.has_chunk_embeddings()) {
    try {
      auto q = l2_normalize(encoder_->encode(topic));
      auto stored = store_.chunk_embeddings();
      if (q.empty()) throw CollaboratorError("encoder returned an empty vector");
      VectorIndex index((int)q.size(), stored.size());
      for (auto& e : stored) {
        if (e.vector.size() == q.size()) index.add(e.owner_id, l2_normalize(e.vector));
      }
      for (auto& [id, sim] : index.search(q, std::max(5, limit / 2))) {
        if (sim > 0.0f) board.add_id(id, w.vector);
      }
    } catch (const CollaboratorError& e) {
      std::cerr << "warning: vector retrieval skipped: " << e.what() << "\n";
    }
  }

  // path
  if (!tokens.empty()) {
    std::set<std::string> topic_set(tokens.begin(), tokens.end());
    for (auto& f : store_.files()) {
      bool hit = false;
      for (auto& t : word_tokens(f.path, 2)) {
        if (topic_set.count(t)) { hit = true; break; }
      }
      if (!hit) continue;
      for (auto& c : store_.chunks_for_file(f.id)) board.add(c, w.path);
    }
  }

  // symbols by name
  std::vector<Symbol> matched;
  std::set<int64_t> seen_symbols;
  for (auto& t : tokens) {
    if (t.size() < 3) continue;
    for (auto& s : store_.search_symbols(t, pool)) {
      if (seen_symbols.insert(s.id).second) matched.push_back(s);
    }
  }
  for (auto& s : matched) {
    for (auto& c : symbol_chunks(store_, s)) board.add(c, w.symbol);
  }

  // summaries
  bundle.summaries = store_.search_summaries(topic, std::max(5, limit / 2));
  for (auto& s : bundle.summaries) {
    auto file_id = summary_file(store_, s);
    if (!file_id) continue;
    auto chunks = store_.chunks_for_file(*file_id);
    if (!chunks.empty()) board.add(chunks.front(), w.summary);
  }

  // graph expansion, breadth first up to the radius
  std::vector<Symbol> neighbours;
  std::set<std::tuple<int64_t, int64_t, int>> seen_edges;
  std::vector<int64_t> frontier;
  for (auto& s : matched) frontier.push_back(s.id);
  for (int hop = 0; hop < opts_.graph_radius && !frontier.empty(); ++hop) {
    std::vector<int64_t> next;
    for (auto id : frontier) {
      for (auto& e : store_.edges_for_symbol(id)) {
        if (!seen_edges.insert({e.src_symbol_id, e.dst_symbol_id, (int)e.type}).second) continue;
        bundle.edges.push_back(e);
        int64_t other = e.src_symbol_id == id ? e.dst_symbol_id : e.src_symbol_id;
        if (!seen_symbols.insert(other).second) continue;
        auto sym = store_.symbol_by_id(other);
        if (!sym) continue;
        neighbours.push_back(*sym);
        next.push_back(other);
      }
    }
    frontier.swap(next);
  }
  for (auto& s : neighbours) {
    for (auto& c : symbol_chunks(store_, s)) board.add(c, w.graph);
  }
  bundle.symbols = matched;
  bundle.symbols.insert(bundle.symbols.end(), neighbours.begin(), neighbours.end());

  // kind heuristic
  auto kinds = wanted_kinds(tokens);
  for (auto& kind : kinds) {
    for (auto& c : store_.chunks_of_kind(kind, pool)) board.add(c, w.kind);
  }

  // literal token boost, then rank
  std::vector<std::pair<int64_t, double>> ranked;
  for (auto& [id, score] : board.scores()) {
    std::string text = to_lower(board.chunk(id).text);
    int present = 0;
    for (auto& t : tokens) {
      if (text.find(t) != std::string::npos) ++present;
    }
    ranked.emplace_back(id, score + present);
  }
  std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
    if (a.second != b.second) return a.second > b.second;
    return a.first < b.first;
  });
  if ((int)ranked.size() > limit) ranked.resize((size_t)limit);

  for (auto& [id, score] : ranked) {
    bundle.chunks.push_back(board.chunk(id));
    bundle.scores.push_back(score);
  }
  return bundle;
}

std::vector<std::string> evidence_blocks(const EvidenceBundle& bundle, const Store& store) {
  std::unordered_map<int64_t, std::string> paths;
  std::vector<std::string> out;
  for (auto& c : bundle.chunks) {
    auto it = paths.find(c.file_id);
    if (it == paths.end()) {
      auto f = store.file_by_id(c.file_id);
      if (!f) continue;
      it = paths.emplace(c.file_id, f->path).first;
    }
    out.push_back("[" + cite_chunk(c, it->second) + "]\n" + c.text);
  }
  return out;
}

std::vector<std::string> allowed_citations(const EvidenceBundle& bundle, const Store& store) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  auto take = [&](const std::string& text) {
    for (auto& c : extract_citations(text)) {
      if (seen.insert(c).second) out.push_back(c);
    }
  };
  // only the header line of a block, so citations quoted inside code do not leak in
  for (auto& block : evidence_blocks(bundle, store)) take(block.substr(0, block.find('\n')));
  for (auto& s : bundle.summaries) take(s.text);
  return out;
}
