#pragma once
#include "errors.hpp"
#include "store.hpp"
#include <optional>
#include <string>
#include <vector>

// path:start-end, 1-indexed, inclusive.
struct Citation {
  std::string path;
  int start = 1;
  int end = 1;

  bool operator==(const Citation& o) const {
    return path == o.path && start == o.start && end == o.end;
  }
};

// Throws FormatError naming what is wrong with `text`.
Citation parse_citation(const std::string& text);
std::optional<Citation> try_parse_citation(const std::string& text);

std::string format_citation(const std::string& path, int start, int end);
std::string format_citation(const Citation& c);
std::string cite_chunk(const Chunk& chunk, const std::string& path);

// Raw contents of every [...] group, in order.
std::vector<std::string> bracket_tokens(const std::string& text);

// A bracket may hold several citations separated by commas or semicolons.
// Whitespace separates citations only where a part holds more than one ':',
// so paths containing spaces survive.
std::vector<std::string> split_bracket(const std::string& token);

// Every well-formed citation found inside brackets; malformed parts are dropped.
std::vector<std::string> extract_citations(const std::string& text);

struct Resolution {
  std::optional<FileRecord> file;
  std::optional<Chunk> chunk;
  std::optional<CitationFailure> failure;

  bool ok() const { return chunk.has_value(); }
};

Resolution resolve_citation(const Citation& c, const Store& store);

// Parses and resolves; FormatError or CitationError on failure.
Chunk resolve_or_throw(const std::string& citation, const Store& store);
