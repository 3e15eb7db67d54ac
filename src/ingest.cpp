#include "ingest.hpp"
#include "chunker.hpp"
#include "collaborators.hpp"
#include "errors.hpp"
#include "hashing.hpp"
#include "parser.hpp"
#include "text_util.hpp"
#include <sys/stat.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

// Everything a worker computes for one file. No store access.
struct PreparedFile {
  std::string rel;
  FileRecord rec;
  bool unchanged = false;
  std::vector<ChunkSpec> chunks;
  std::vector<SymbolSpec> symbols;   // declarations first, then imports
  size_t n_decls = 0;
  std::vector<EdgeSpec> edges;
  std::string error;
};

PreparedFile prepare_file(const std::string& root, const std::string& rel,
                          const std::optional<std::string>& known_hash,
                          const ParserAdapter& parser) {
  PreparedFile out;
  out.rel = rel;
  std::string full = (fs::path(root) / rel).string();

  std::ifstream in(full, std::ios::binary);
  if (!in) {
    out.error = "cannot open " + full;
    return out;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  std::string text = ss.str();

  out.rec.path = rel;
  out.rec.hash = sha256_hex(text);
  out.rec.size = (int64_t)text.size();
  out.rec.lang = detect_language(rel);
  struct stat st{};
  out.rec.mtime = format_utc(::stat(full.c_str(), &st) == 0 ? st.st_mtime : std::time(nullptr));
  if (known_hash && *known_hash == out.rec.hash) {
    out.unchanged = true;
    return out;
  }

  std::unique_ptr<SyntaxTree> tree;
  if (parser.supports(out.rec.lang)) tree = parser.parse(text, out.rec.lang);

  if (tree) {
    out.rec.parsed = true;
    out.chunks = parser.chunks(*tree);
    out.symbols = parser.symbols(*tree);
    out.n_decls = out.symbols.size();
    out.edges = parser.edges(*tree, out.symbols);
    for (auto& imp : parser.imports(*tree)) {
      SymbolSpec s;
      s.name = imp.name;
      s.kind = "import";
      s.signature = imp.module;
      s.start_line = imp.line;
      s.end_line = imp.line;
      out.symbols.push_back(std::move(s));
    }
    // top-level code only: keep the file citable
    if (out.chunks.empty()) out.chunks = whole_file_chunk(text);
  } else {
    out.rec.parsed = false;
    out.chunks = is_text_format(out.rec.lang) ? paragraph_chunks(text) : whole_file_chunk(text);
  }
  return out;
}

// Index of the declaration overlapping the chunk the most; ties go to the tighter span.
std::optional<size_t> best_overlap(const ChunkSpec& c, const std::vector<SymbolSpec>& syms, size_t n_decls) {
  std::optional<size_t> best;
  int best_overlap = 0, best_span = 0;
  for (size_t i = 0; i < n_decls; ++i) {
    int ov = std::min(c.end_line, syms[i].end_line) - std::max(c.start_line, syms[i].start_line) + 1;
    if (ov <= 0) continue;
    int span = syms[i].end_line - syms[i].start_line;
    if (!best || ov > best_overlap || (ov == best_overlap && span < best_span)) {
      best = i;
      best_overlap = ov;
      best_span = span;
    }
  }
  return best;
}

struct WriteResult {
  int chunks = 0;
  int symbols = 0;
  int edges = 0;
};

WriteResult write_file(Store& store, PreparedFile& pf, const std::optional<FileRecord>& existing,
                       TextEncoder* encoder) {
  WriteResult wr;
  Store::Transaction tx(store);

  int64_t file_id;
  if (existing) {
    pf.rec.id = existing->id;
    store.update_file(pf.rec);
    store.clear_file_contents(existing->id);
    file_id = existing->id;
  } else {
    file_id = store.add_file(pf.rec);
  }

  std::vector<Symbol> syms;
  syms.reserve(pf.symbols.size());
  for (auto& s : pf.symbols) {
    Symbol row;
    row.file_id = file_id;
    row.name = s.name;
    row.kind = s.kind;
    row.signature = s.signature;
    row.start_line = s.start_line;
    row.end_line = s.end_line;
    row.doc = s.doc;
    syms.push_back(std::move(row));
  }
  auto ids = store.add_symbols(syms);
  wr.symbols = (int)ids.size();

  std::vector<Edge> edges;
  std::vector<PendingEdge> pending;
  auto parents = infer_parents(pf.symbols);
  for (size_t i = 0; i < parents.size(); ++i) {
    if (parents[i] < 0) continue;
    store.set_symbol_parent(ids[i], ids[parents[i]]);
    if (pf.symbols[i].kind != "import") edges.push_back({ids[i], ids[parents[i]], EdgeType::MemberOf});
  }

  std::vector<Chunk> chunks;
  chunks.reserve(pf.chunks.size());
  for (auto& c : pf.chunks) {
    Chunk row;
    row.file_id = file_id;
    row.start_line = c.start_line;
    row.end_line = c.end_line;
    row.kind = c.kind;
    row.text = c.text;
    row.hash = sha256_hex(c.text);
    if (auto s = best_overlap(c, pf.symbols, pf.n_decls)) row.symbol_id = ids[*s];
    chunks.push_back(std::move(row));
  }
  auto chunk_ids = store.add_chunks(chunks);
  wr.chunks = (int)chunk_ids.size();

  // intra-file name resolution; first declaration of a name wins
  std::unordered_map<std::string, int64_t> local, imported;
  for (size_t i = 0; i < pf.symbols.size(); ++i) {
    auto& target = i < pf.n_decls ? local : imported;
    target.emplace(pf.symbols[i].name, ids[i]);
  }
  for (auto& e : pf.edges) {
    int64_t src;
    if (e.src_index >= 0) {
      src = ids[e.src_index];
    } else {
      auto it = local.find(e.src);
      if (it == local.end()) continue;
      src = it->second;
    }
    if (e.type == EdgeType::MemberOf) {
      auto it = local.find(e.dst);
      if (it != local.end() && it->second != src) edges.push_back({src, it->second, e.type});
      continue;
    }
    auto it = local.find(e.dst);
    if (it != local.end()) {
      edges.push_back({src, it->second, e.type});
      continue;
    }
    auto imp = imported.find(e.dst);
    if (imp != imported.end()) edges.push_back({src, imp->second, EdgeType::Imports});
    pending.push_back(PendingEdge{src, file_id, e.dst, e.type});
  }
  store.add_edges(edges);
  store.add_pending_edges(pending);
  wr.edges = (int)edges.size();

  if (encoder) {
    try {
      std::vector<Embedding> ce, se;
      for (size_t i = 0; i < chunks.size(); ++i) ce.push_back({chunk_ids[i], encoder->encode(chunks[i].text)});
      for (size_t i = 0; i < pf.n_decls; ++i) {
        std::string t = syms[i].name + " " + syms[i].signature + " " + syms[i].doc;
        se.push_back({ids[i], encoder->encode(t)});
      }
      store.add_chunk_embeddings(ce);
      store.add_symbol_embeddings(se);
    } catch (const CollaboratorError& e) {
      std::cerr << "warning: embeddings skipped for " << pf.rel << ": " << e.what() << "\n";
    }
  }

  tx.commit();
  return wr;
}

// How many tokens of an import's module show up in a candidate's path.
int module_affinity(const std::string& module, const std::string& path) {
  auto path_tokens = word_tokens(path, 1);
  int score = 0;
  for (auto& t : word_tokens(module, 1)) {
    if (std::find(path_tokens.begin(), path_tokens.end(), t) != path_tokens.end()) ++score;
  }
  return score;
}

} // namespace

IngestStats ingest_repo(const std::string& root, Store& store, const IngestOptions& opts,
                        TextEncoder* encoder) {
  if (!fs::is_directory(root)) throw std::runtime_error("not a directory: " + root);

  auto files = list_source_files(root, opts.rules);
  if (opts.max_files > 0 && (int)files.size() > opts.max_files) files.resize((size_t)opts.max_files);

  IngestStats stats;
  stats.files_seen = (int)files.size();
  if (!opts.quiet) std::cerr << "ingest: " << files.size() << " files under " << root << "\n";

  ParserAdapter parser;
  const size_t window = (size_t)std::max(1, opts.workers);

  for (size_t base = 0; base < files.size(); base += window) {
    size_t end = std::min(files.size(), base + window);

    std::vector<std::optional<FileRecord>> existing;
    std::vector<std::future<PreparedFile>> jobs;
    for (size_t i = base; i < end; ++i) {
      existing.push_back(store.file_by_path(files[i]));
      std::optional<std::string> known;
      if (existing.back()) known = existing.back()->hash;
      jobs.push_back(std::async(std::launch::async, prepare_file, std::cref(root),
                                std::cref(files[i]), known, std::cref(parser)));
    }

    for (size_t j = 0; j < jobs.size(); ++j) {
      PreparedFile pf = jobs[j].get();
      if (!pf.error.empty()) {
        std::cerr << "warning: " << pf.error << "\n";
        continue;
      }
      if (pf.unchanged) {
        ++stats.files_unchanged;
        continue;
      }
      if (!pf.rec.parsed) ++stats.files_unparsed;
      auto wr = write_file(store, pf, existing[j], encoder);
      (existing[j] ? stats.files_updated : stats.files_added)++;
      stats.chunks += wr.chunks;
      stats.symbols += wr.symbols;
      stats.edges += wr.edges;
    }
    if (!opts.quiet && end % 100 < window && end < files.size())
      std::cerr << "ingest: " << end << "/" << files.size() << " files\n";
  }

  auto cross = resolve_cross_file(store);
  stats.cross_file_edges = cross.resolved;
  stats.unresolved_edges = cross.unresolved;

  if (!opts.quiet) {
    std::cerr << "ingest: added=" << stats.files_added << " updated=" << stats.files_updated
              << " unchanged=" << stats.files_unchanged << " unparsed=" << stats.files_unparsed
              << " chunks=" << stats.chunks << " symbols=" << stats.symbols
              << " edges=" << stats.edges + stats.cross_file_edges << "\n";
  }
  return stats;
}

CrossFileStats resolve_cross_file(Store& store) {
  CrossFileStats stats;
  auto symbols = store.symbols();

  std::map<int64_t, std::string> paths;
  for (auto& f : store.files()) paths[f.id] = f.path;

  std::unordered_map<std::string, std::vector<const Symbol*>> by_name;
  for (auto& s : symbols) {
    if (s.kind != "import") by_name[s.name].push_back(&s);
  }

  // best definition outside `file_id`, preferring paths that echo `hint`
  auto pick = [&](const std::string& name, int64_t file_id, const std::string& hint) -> const Symbol* {
    auto it = by_name.find(name);
    if (it == by_name.end()) return nullptr;
    const Symbol* best = nullptr;
    int best_score = -1;
    for (auto* s : it->second) {
      if (s->file_id == file_id) continue;
      int score = hint.empty() ? 0 : module_affinity(hint, paths[s->file_id]);
      if (score > best_score) {
        best = s;
        best_score = score;
      }
    }
    return best;
  };

  std::vector<Edge> edges;
  for (auto& s : symbols) {
    if (s.kind != "import") continue;
    if (auto* target = pick(s.name, s.file_id, s.signature)) {
      edges.push_back({s.id, target->id, EdgeType::ImportsResolved});
    }
  }
  for (auto& d : store.pending_edges()) {
    if (auto* target = pick(d.dst_name, d.file_id, "")) {
      edges.push_back({d.src_symbol_id, target->id, d.type});
    } else {
      ++stats.unresolved;
    }
  }
  store.add_edges(edges);
  stats.resolved = (int)edges.size();
  return stats;
}
