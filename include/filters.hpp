#pragma once
#include <memory>
#include <string>
#include <vector>

namespace re2 { class RE2; }

struct ExclusionRules {
  std::vector<std::string> dirs;   // directory names skipped at any depth
  std::vector<std::string> globs;  // extra patterns, .gitignore syntax
  bool respect_gitignore = true;

  static ExclusionRules defaults();
};

// Compiled exclusion patterns for one root. Paths are relative, '/' separated.
class PathFilter {
public:
  PathFilter(const std::string& root, const ExclusionRules& rules);
  ~PathFilter();
  PathFilter(const PathFilter&) = delete;
  PathFilter& operator=(const PathFilter&) = delete;

  bool excluded(const std::string& rel_path, bool is_dir) const;

private:
  struct Pattern {
    std::unique_ptr<re2::RE2> re;
    bool negate = false;
    bool dir_only = false;
  };
  void add_pattern(const std::string& line);

  std::vector<std::string> dirs_;
  std::vector<Pattern> patterns_;
};

// Anchored patterns (containing a '/') match from the root; others match a basename.
std::string glob_to_regex(const std::string& glob, bool anchored);

bool has_binary_extension(const std::string& path);
bool looks_binary(const std::string& head);
