#include "citation.hpp"
#include "text_util.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <climits>

namespace {

int parse_bound(const std::string& digits, const std::string& text, const char* which) {
  if (digits.empty())
    throw FormatError(std::string("citation has empty ") + which + " line: " + text);
  if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; }))
    throw FormatError(std::string("citation ") + which + " line is not a number: " + text);
  if (digits.size() > 10) throw FormatError("citation line number out of range: " + text);
  long long v = std::stoll(digits);
  if (v > INT_MAX) throw FormatError("citation line number out of range: " + text);
  if (v <= 0) throw FormatError(std::string("citation ") + which + " line must be positive: " + text);
  return (int)v;
}

} // namespace

Citation parse_citation(const std::string& text) {
  auto colon = text.find(':');
  if (colon == std::string::npos) throw FormatError("citation missing ':' separator: " + text);
  if (text.find(':', colon + 1) != std::string::npos)
    throw FormatError("citation path must not contain ':': " + text);

  Citation c;
  c.path = text.substr(0, colon);
  if (c.path.empty()) throw FormatError("citation has empty path: " + text);
  if (c.path.front() == '[' || c.path.back() == ']' || c.path.front() == ']' || c.path.back() == '[')
    throw FormatError("citation path has stray brackets: " + text);

  std::string span = text.substr(colon + 1);
  auto dash = span.find('-');
  if (dash == std::string::npos) throw FormatError("citation missing '-' in line range: " + text);
  c.start = parse_bound(span.substr(0, dash), text, "start");
  c.end = parse_bound(span.substr(dash + 1), text, "end");
  if (c.start > c.end) throw FormatError("citation start line exceeds end line: " + text);
  return c;
}

std::optional<Citation> try_parse_citation(const std::string& text) {
  try {
    return parse_citation(text);
  } catch (const FormatError&) {
    return std::nullopt;
  }
}

std::string format_citation(const std::string& path, int start, int end) {
  return path + ":" + std::to_string(start) + "-" + std::to_string(end);
}

std::string format_citation(const Citation& c) { return format_citation(c.path, c.start, c.end); }

std::string cite_chunk(const Chunk& chunk, const std::string& path) {
  return format_citation(path, chunk.start_line, chunk.end_line);
}

std::vector<std::string> bracket_tokens(const std::string& text) {
  static const RE2 bracket("\\[([^\\]]+)\\]");
  std::vector<std::string> out;
  re2::StringPiece input(text);
  std::string tok;
  while (RE2::FindAndConsume(&input, bracket, &tok)) out.push_back(tok);
  return out;
}

std::vector<std::string> split_bracket(const std::string& token) {
  std::vector<std::string> out;
  auto push = [&out](const std::string& part) {
    std::string t = trim(part);
    if (t.empty()) return;
    // paths may contain spaces; only a run of several citations has several ':'
    if (std::count(t.begin(), t.end(), ':') < 2) {
      out.push_back(t);
      return;
    }
    std::string cur;
    for (char c : t) {
      if (c == ' ' || c == '\t') {
        if (!cur.empty()) out.push_back(cur);
        cur.clear();
      } else {
        cur.push_back(c);
      }
    }
    if (!cur.empty()) out.push_back(cur);
  };
  std::string cur;
  for (char c : token) {
    if (c == ',' || c == ';') {
      push(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  push(cur);
  return out;
}

std::vector<std::string> extract_citations(const std::string& text) {
  std::vector<std::string> out;
  for (auto& tok : bracket_tokens(text)) {
    for (auto& part : split_bracket(tok)) {
      if (try_parse_citation(part)) out.push_back(part);
    }
  }
  return out;
}

Resolution resolve_citation(const Citation& c, const Store& store) {
  Resolution r;
  r.file = store.file_by_path(c.path);
  if (!r.file) {
    r.failure = CitationFailure::UnknownFile;
    return r;
  }
  r.chunk = store.find_chunk_covering(r.file->id, c.start, c.end);
  if (!r.chunk) r.failure = CitationFailure::UnknownRange;
  return r;
}

Chunk resolve_or_throw(const std::string& citation, const Store& store) {
  auto r = resolve_citation(parse_citation(citation), store);
  if (!r.ok()) throw CitationError(*r.failure, citation);
  return *r.chunk;
}
