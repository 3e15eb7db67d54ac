#pragma once
#include "store.hpp"
#include <string>
#include <vector>

class TextEncoder;

struct RetrievalWeights {
  double lexical = 1.0;   // full-text hit
  double vector = 0.2;    // embedding neighbour
  double path = 0.4;      // file path shares a topic token
  double symbol = 0.3;    // owning symbol name matches
  double summary = 0.5;   // representative chunk of a matching summary
  double graph = 0.25;    // one edge hop from a matching symbol
  double kind = 0.35;     // topic asks for functions/classes/methods
};

struct RetrievalOptions {
  int limit = 20;
  int graph_radius = 1;
  RetrievalWeights weights;
};

struct EvidenceBundle {
  std::vector<Chunk> chunks;      // best first
  std::vector<double> scores;     // parallel to chunks
  std::vector<Summary> summaries;
  std::vector<Symbol> symbols;
  std::vector<Edge> edges;

  bool empty() const { return chunks.empty(); }
};

// Hybrid ranking over one store. Holds no state between calls.
class Retriever {
public:
  explicit Retriever(const Store& store, TextEncoder* encoder = nullptr,
                     RetrievalOptions opts = RetrievalOptions());

  // limit <= 0 uses the configured default
  EvidenceBundle retrieve(const std::string& topic, int limit = 0) const;

private:
  const Store& store_;
  TextEncoder* encoder_;
  RetrievalOptions opts_;
};

// "[path:start-end]\n<text>" for every chunk of the bundle.
std::vector<std::string> evidence_blocks(const EvidenceBundle& bundle, const Store& store);

// Citations a draft may use: those of the evidence blocks and of the bundle summaries.
std::vector<std::string> allowed_citations(const EvidenceBundle& bundle, const Store& store);
