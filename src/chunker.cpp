#include "chunker.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using std::string;
namespace fs = std::filesystem;

string detect_language(const string& path) {
  static const std::pair<const char*, const char*> table[] = {
    {".py", "python"}, {".js", "javascript"}, {".jsx", "javascript"}, {".mjs", "javascript"},
    {".cjs", "javascript"}, {".ts", "typescript"}, {".tsx", "tsx"}, {".md", "markdown"},
    {".markdown", "markdown"}, {".txt", "text"}, {".rst", "rst"}, {".json", "json"},
    {".go", "go"}, {".rs", "rust"}, {".java", "java"}, {".c", "c"}, {".h", "c"},
    {".cc", "cpp"}, {".cpp", "cpp"}, {".cxx", "cpp"}, {".hpp", "cpp"}, {".hh", "cpp"},
    {".cs", "c_sharp"}, {".rb", "ruby"}, {".php", "php"},
  };
  string name = fs::path(path).filename().string();
  auto dot = name.rfind('.');
  if (dot == string::npos || dot == 0) return "unknown";
  string ext = to_lower(name.substr(dot));
  for (auto& [e, lang] : table) if (ext == e) return lang;
  return ext.substr(1);
}

bool is_text_format(const string& lang) {
  return lang == "markdown" || lang == "text" || lang == "rst";
}

static bool sniff_binary(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) return true;
  string head(8000, '\0');
  in.read(&head[0], (std::streamsize)head.size());
  head.resize((size_t)in.gcount());
  return looks_binary(head);
}

std::vector<string> list_source_files(const string& root, const ExclusionRules& rules) {
  PathFilter filter(root, rules);
  std::vector<string> out;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) throw std::runtime_error("cannot walk " + root + ": " + ec.message());
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      std::cerr << "warning: " << ec.message() << "\n";
      ec.clear();
      continue;
    }
    string rel = fs::relative(it->path(), root).generic_string();
    if (it->is_directory()) {
      if (filter.excluded(rel, true)) it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file()) continue;
    if (filter.excluded(rel, false)) continue;
    if (has_binary_extension(rel) || sniff_binary(it->path())) continue;
    out.push_back(rel);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<ChunkSpec> paragraph_chunks(const string& text) {
  auto lines = split_lines(text);
  std::vector<ChunkSpec> chunks;
  if (lines.empty()) return chunks;

  bool has_blank = std::any_of(lines.begin(), lines.end(),
                               [](const string& l) { return trim(l).empty(); });
  if (!has_blank) return whole_file_chunk(text);

  std::vector<string> buf;
  int first = 1;
  auto flush = [&](int last) {
    if (buf.empty()) return;
    string body;
    for (size_t i = 0; i < buf.size(); ++i) {
      if (i) body.push_back('\n');
      body += buf[i];
    }
    chunks.push_back(ChunkSpec{first, last, body, "paragraph"});
    buf.clear();
  };
  for (int i = 0; i < (int)lines.size(); ++i) {
    int lineno = i + 1;
    if (trim(lines[i]).empty()) {
      flush(lineno - 1);
      continue;
    }
    if (buf.empty()) first = lineno;
    buf.push_back(lines[i]);
  }
  flush((int)lines.size());
  return chunks;
}

std::vector<ChunkSpec> whole_file_chunk(const string& text) {
  auto lines = split_lines(text);
  if (lines.empty()) return {};
  return {ChunkSpec{1, (int)lines.size(), text, "block"}};
}
