#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {

// Reads `key` from `obj` into `dst` when present.
template <typename T>
void take(const json& obj, const char* key, T& dst, const std::string& where) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return;
  try {
    dst = it->template get<T>();
  } catch (const json::exception&) {
    throw FormatError("config: " + where + key + " has the wrong type");
  }
}

// numbers only; nlohmann would happily turn a bool into a number
void take_number(const json& obj, const char* key, double& dst, const std::string& where) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return;
  if (!it->is_number()) throw FormatError("config: " + where + key + " must be a number");
  dst = it->get<double>();
}

void take_int(const json& obj, const char* key, int& dst, const std::string& where) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return;
  if (!it->is_number_integer()) throw FormatError("config: " + where + key + " must be an integer");
  dst = it->get<int>();
}

const json* section(const json& root, const char* key) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) return nullptr;
  if (!it->is_object()) throw FormatError(std::string("config: ") + key + " must be an object");
  return &*it;
}

} // namespace

AppConfig apply_config_json(const std::string& json_text, AppConfig base) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw FormatError(std::string("config: ") + e.what());
  }
  if (!j.is_object()) throw FormatError("config: top level must be an object");

  PipelineConfig& p = base.pipeline;
  if (auto g = section(j, "gate")) {
    take_number(*g, "min_support_rate", p.gate.min_support_rate, "gate.");
    take_number(*g, "min_coverage", p.gate.min_coverage, "gate.");
    take_number(*g, "min_citation_rate", p.gate.min_citation_rate, "gate.");
    take_int(*g, "max_high_issues", p.gate.max_high_issues, "gate.");
    take_int(*g, "max_medium_issues", p.gate.max_medium_issues, "gate.");
  }
  take_int(j, "max_iters", p.max_iters, "");
  take_int(j, "evidence_limit", p.evidence_limit, "");
  take_int(j, "expected_items", p.expected_items, "");
  take(j, "summarize", p.summarize, "");
  take(j, "chunk_summaries", p.chunk_summaries, "");
  take(j, "fallback_to_first_chunk", p.fallback_to_first_chunk, "");

  if (auto r = section(j, "retrieval")) {
    take_int(*r, "graph_radius", p.retrieval.graph_radius, "retrieval.");
    if (auto w = section(*r, "weights")) {
      auto& wt = p.retrieval.weights;
      take_number(*w, "lexical", wt.lexical, "retrieval.weights.");
      take_number(*w, "vector", wt.vector, "retrieval.weights.");
      take_number(*w, "path", wt.path, "retrieval.weights.");
      take_number(*w, "symbol", wt.symbol, "retrieval.weights.");
      take_number(*w, "summary", wt.summary, "retrieval.weights.");
      take_number(*w, "graph", wt.graph, "retrieval.weights.");
      take_number(*w, "kind", wt.kind, "retrieval.weights.");
    }
  }

  if (auto in = section(j, "ingest")) {
    take(*in, "respect_gitignore", p.ingest.rules.respect_gitignore, "ingest.");
    std::vector<std::string> extra;
    take(*in, "exclude", extra, "ingest.");
    p.ingest.rules.globs.insert(p.ingest.rules.globs.end(), extra.begin(), extra.end());
    take_int(*in, "workers", p.ingest.workers, "ingest.");
    take_int(*in, "max_files", p.ingest.max_files, "ingest.");
  }

  if (auto l = section(j, "llm")) {
    take_int(*l, "n_ctx", base.llm.n_ctx, "llm.");
    take_int(*l, "max_new_tokens", base.llm.max_new_tokens, "llm.");
    take_int(*l, "timeout_seconds", base.llm.timeout_seconds, "llm.");
  }

  if (p.max_iters < 1) throw FormatError("config: max_iters must be at least 1");
  if (p.ingest.workers < 1) throw FormatError("config: ingest.workers must be at least 1");
  return base;
}

AppConfig load_config(const std::string& path, AppConfig base) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("config: cannot read " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  return apply_config_json(ss.str(), std::move(base));
}
