// src/filters.cpp
#include "filters.hpp"
#include "text_util.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <fstream>
#include <iostream>

ExclusionRules ExclusionRules::defaults() {
  ExclusionRules r;
  r.dirs = {".git", "node_modules", "__pycache__", ".venv", "venv", "build", "dist", "target"};
  return r;
}

std::string glob_to_regex(const std::string& glob, bool anchored) {
  std::string re = anchored ? "^" : "^(?:.*/)?";
  for (size_t i = 0; i < glob.size(); ++i) {
    char c = glob[i];
    if (c == '*') {
      if (i + 1 < glob.size() && glob[i + 1] == '*') {
        // "**/" matches zero or more directories
        if (i + 2 < glob.size() && glob[i + 2] == '/') { re += "(?:.*/)?"; i += 2; }
        else { re += ".*"; ++i; }
      } else {
        re += "[^/]*";
      }
    } else if (c == '?') {
      re += "[^/]";
    } else if (c == '[') {
      auto close = glob.find(']', i + 1);
      if (close == std::string::npos) { re += "\\["; continue; }
      std::string cls = glob.substr(i + 1, close - i - 1);
      if (!cls.empty() && cls[0] == '!') cls[0] = '^';
      re += "[" + cls + "]";
      i = close;
    } else {
      re += RE2::QuoteMeta(std::string(1, c));
    }
  }
  re += "(?:/.*)?$";
  return re;
}

PathFilter::PathFilter(const std::string& root, const ExclusionRules& rules) : dirs_(rules.dirs) {
  for (auto& g : rules.globs) add_pattern(g);
  if (!rules.respect_gitignore) return;
  std::ifstream in(root + "/.gitignore");
  std::string line;
  while (std::getline(in, line)) add_pattern(line);
}

PathFilter::~PathFilter() = default;

void PathFilter::add_pattern(const std::string& raw) {
  std::string line = trim(raw);
  if (line.empty() || line[0] == '#') return;
  Pattern p;
  if (line[0] == '!') { p.negate = true; line = line.substr(1); }
  if (!line.empty() && line.back() == '/') { p.dir_only = true; line.pop_back(); }
  if (line.empty()) return;
  bool anchored = line.find('/') != std::string::npos;
  if (line[0] == '/') line = line.substr(1);
  p.re = std::make_unique<RE2>(glob_to_regex(line, anchored));
  if (!p.re->ok()) {
    std::cerr << "warning: ignoring exclusion pattern '" << raw << "': " << p.re->error() << "\n";
    return;
  }
  patterns_.push_back(std::move(p));
}

bool PathFilter::excluded(const std::string& rel_path, bool is_dir) const {
  std::string base = rel_path.substr(rel_path.rfind('/') == std::string::npos ? 0 : rel_path.rfind('/') + 1);
  if (is_dir && std::find(dirs_.begin(), dirs_.end(), base) != dirs_.end()) return true;
  // last matching pattern wins, as in .gitignore
  bool out = false;
  for (auto& p : patterns_) {
    if (p.dir_only && !is_dir) continue;
    if (RE2::FullMatch(rel_path, *p.re)) out = !p.negate;
  }
  return out;
}

bool has_binary_extension(const std::string& path) {
  static const char* bad[] = {".png", ".jpg", ".jpeg", ".gif", ".bmp", ".ico", ".tif", ".tiff",
                              ".pdf", ".zip", ".gz", ".tgz", ".bz2", ".xz", ".7z", ".jar",
                              ".mp4", ".mov", ".mp3", ".wav", ".ogg", ".bin", ".so", ".dll",
                              ".dylib", ".a", ".o", ".obj", ".exe", ".class", ".pyc", ".woff",
                              ".woff2", ".ttf", ".db", ".sqlite"};
  auto dot = path.rfind('.');
  if (dot == std::string::npos || path.find('/', dot) != std::string::npos) return false;
  std::string ext = to_lower(path.substr(dot));
  for (auto* b : bad) if (ext == b) return true;
  return false;
}

bool looks_binary(const std::string& head) {
  return head.find('\0') != std::string::npos;
}
