#pragma once
#include "models.hpp"
#include <memory>
#include <string>
#include <vector>

struct TSLanguage;
struct TSTree;

// Universal node categories every grammar is mapped onto.
enum class NodeCategory { None, Function, Class, Import, Call, Inherit, Member, Implements, Export };

struct LanguageSpec {
  const char* name;
  const TSLanguage* (*grammar)();
  // `field` is the field name the node occupies in its parent, or "".
  NodeCategory (*classify)(const char* node_type, const char* field);
  bool (*is_identifier)(const char* node_type);
  // Turns the text of one import node into (module, name) pairs.
  std::vector<std::pair<std::string, std::string>> (*import_names)(const std::string& text);
};

// nullptr when the language has no grammar.
const LanguageSpec* find_language(const std::string& lang);
std::vector<std::string> supported_languages();

struct ChunkSpec {
  int start_line = 1;
  int end_line = 1;
  std::string text;
  std::string kind;
};

struct SymbolSpec {
  std::string name;
  std::string kind;
  std::string signature;
  int start_line = 1;
  int end_line = 1;
  std::string doc;
};

struct ImportSpec {
  std::string module;
  std::string name;
  int line = 1;
};

// src_index points into the symbol list handed to ParserAdapter::edges.
struct EdgeSpec {
  int src_index = -1;
  std::string src;
  std::string dst;
  EdgeType type = EdgeType::Calls;
};

class SyntaxTree {
public:
  SyntaxTree(TSTree* tree, std::string source, const LanguageSpec* lang);
  ~SyntaxTree();
  SyntaxTree(const SyntaxTree&) = delete;
  SyntaxTree& operator=(const SyntaxTree&) = delete;

  TSTree* raw() const { return tree_; }
  const std::string& source() const { return source_; }
  const std::vector<std::string>& lines() const { return lines_; }
  const LanguageSpec& language() const { return *lang_; }

private:
  TSTree* tree_;
  std::string source_;
  std::vector<std::string> lines_;
  const LanguageSpec* lang_;
};

// Stateless; safe to share between ingestion workers.
class ParserAdapter {
public:
  bool supports(const std::string& lang) const;
  std::unique_ptr<SyntaxTree> parse(const std::string& text, const std::string& lang) const;

  std::vector<ChunkSpec> chunks(const SyntaxTree& tree) const;
  std::vector<SymbolSpec> symbols(const SyntaxTree& tree) const;
  std::vector<ImportSpec> imports(const SyntaxTree& tree) const;
  std::vector<EdgeSpec> edges(const SyntaxTree& tree, const std::vector<SymbolSpec>& symbols) const;
};

// Index of the smallest symbol strictly enclosing symbols[i], or -1.
// Equal spans count only when the candidate comes first.
std::vector<int> infer_parents(const std::vector<SymbolSpec>& symbols);
