#include "parser.hpp"
#include "text_util.hpp"
#include <tree_sitter/api.h>
#include <algorithm>
#include <cstring>

namespace {

struct Decl {
  TSNode node;
  std::string kind;
};

struct WalkContext {
  int enclosing;  // index into the symbol list, -1 at file scope
  int depth;
};

int start_line(TSNode n) { return (int)ts_node_start_point(n).row + 1; }
int end_line(TSNode n) { return (int)ts_node_end_point(n).row + 1; }

const char* field_of(TSNode parent, uint32_t i) {
  const char* f = ts_node_field_name_for_child(parent, i);
  return f ? f : "";
}

TSNode field(TSNode n, const char* name) {
  return ts_node_child_by_field_name(n, name, (uint32_t)std::strlen(name));
}

std::string node_text(const SyntaxTree& t, TSNode n) {
  uint32_t a = ts_node_start_byte(n), b = ts_node_end_byte(n);
  if (a >= t.source().size() || b <= a) return "";
  return t.source().substr(a, std::min<size_t>(b, t.source().size()) - a);
}

std::string slice_lines(const SyntaxTree& t, int start, int end) {
  const auto& lines = t.lines();
  std::string out;
  for (int l = start; l <= end && l <= (int)lines.size(); ++l) {
    if (l > start) out.push_back('\n');
    out += lines[l - 1];
  }
  return out;
}

std::string first_line(const SyntaxTree& t, TSNode n) {
  int l = start_line(n);
  if (l < 1 || l > (int)t.lines().size()) return "";
  return trim(t.lines()[l - 1]);
}

// Depth-first from the right; null node when nothing matches.
TSNode rightmost_identifier(const SyntaxTree& t, TSNode n) {
  if (ts_node_is_null(n)) return n;
  if (t.language().is_identifier(ts_node_type(n))) return n;
  uint32_t count = ts_node_named_child_count(n);
  for (uint32_t i = count; i > 0; --i) {
    TSNode found = rightmost_identifier(t, ts_node_named_child(n, i - 1));
    if (!ts_node_is_null(found)) return found;
  }
  return TSNode{};
}

// Breadth-first over named children, skipping bodies.
TSNode first_identifier(const SyntaxTree& t, TSNode n, int max_depth) {
  std::vector<TSNode> level{n};
  for (int d = 0; d < max_depth && !level.empty(); ++d) {
    std::vector<TSNode> next;
    for (auto& node : level) {
      uint32_t count = ts_node_child_count(node);
      for (uint32_t i = 0; i < count; ++i) {
        TSNode c = ts_node_child(node, i);
        if (!ts_node_is_named(c)) continue;
        if (std::strcmp(field_of(node, i), "body") == 0) continue;
        if (t.language().is_identifier(ts_node_type(c))) return c;
        next.push_back(c);
      }
    }
    level.swap(next);
  }
  return TSNode{};
}

std::string fallback_name(const std::string& line) {
  std::string s = line.substr(0, line.find('('));
  static const char* const keywords[] = {"async ", "def ", "class ", "function ", "func ",
                                         "fn ", "pub ", "struct ", "impl ", "enum ", "trait "};
  bool stripped = true;
  while (stripped) {
    stripped = false;
    for (auto* k : keywords) {
      if (starts_with(s, k)) { s = trim(s.substr(std::strlen(k))); stripped = true; }
    }
  }
  s = trim(s);
  return s.empty() ? "unknown" : s;
}

std::string symbol_name(const SyntaxTree& t, TSNode node) {
  TSNode n = field(node, "name");
  if (!ts_node_is_null(n)) {
    TSNode id = rightmost_identifier(t, n);
    if (!ts_node_is_null(id)) return node_text(t, id);
  }
  // C-family declarator chain: function_definition -> function_declarator -> identifier
  TSNode d = field(node, "declarator");
  while (!ts_node_is_null(d)) {
    if (t.language().is_identifier(ts_node_type(d))) return node_text(t, d);
    TSNode inner = field(d, "declarator");
    if (ts_node_is_null(inner)) {
      TSNode id = rightmost_identifier(t, d);
      if (!ts_node_is_null(id)) return node_text(t, id);
      break;
    }
    d = inner;
  }
  n = field(node, "type");
  if (!ts_node_is_null(n)) {
    TSNode id = rightmost_identifier(t, n);
    if (!ts_node_is_null(id)) return node_text(t, id);
  }
  TSNode id = first_identifier(t, node, 3);
  if (!ts_node_is_null(id)) return node_text(t, id);
  return fallback_name(first_line(t, node));
}

std::string unquote_docstring(std::string s) {
  s = trim(s);
  static const char* const quotes[] = {"\"\"\"", "'''", "\"", "'"};
  for (auto* q : quotes) {
    size_t n = std::strlen(q);
    if (s.size() >= 2 * n && starts_with(s, q) && ends_with(s, q)) return trim(s.substr(n, s.size() - 2 * n));
  }
  return s;
}

std::string doc_for(const SyntaxTree& t, TSNode node) {
  TSNode body = field(node, "body");
  if (!ts_node_is_null(body) && ts_node_named_child_count(body) > 0) {
    TSNode first = ts_node_named_child(body, 0);
    if (std::strcmp(ts_node_type(first), "expression_statement") == 0 &&
        ts_node_named_child_count(first) > 0) {
      TSNode s = ts_node_named_child(first, 0);
      if (std::strcmp(ts_node_type(s), "string") == 0) return unquote_docstring(node_text(t, s));
    }
  }
  TSNode prev = ts_node_prev_named_sibling(node);
  if (!ts_node_is_null(prev) && std::strstr(ts_node_type(prev), "comment") != nullptr &&
      end_line(prev) + 1 >= start_line(node)) {
    return trim(node_text(t, prev));
  }
  return "";
}

void collect_decls(const SyntaxTree& t, TSNode node, bool in_class, std::vector<Decl>& out) {
  uint32_t count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    TSNode c = ts_node_child(node, i);
    if (!ts_node_is_named(c)) continue;
    const char* type = ts_node_type(c);
    NodeCategory cat = t.language().classify(type, field_of(node, i));
    bool child_in_class = in_class;
    if (cat == NodeCategory::Function) {
      bool method = in_class || std::strncmp(type, "method", 6) == 0;
      out.push_back({c, method ? "method" : "function"});
      child_in_class = false;
    } else if (cat == NodeCategory::Class) {
      out.push_back({c, "class"});
      child_in_class = true;
    }
    collect_decls(t, c, child_in_class, out);
  }
}

void collect_imports(const SyntaxTree& t, TSNode node, std::vector<TSNode>& out) {
  uint32_t count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    TSNode c = ts_node_child(node, i);
    if (!ts_node_is_named(c)) continue;
    if (t.language().classify(ts_node_type(c), field_of(node, i)) == NodeCategory::Import) {
      out.push_back(c);
      continue;
    }
    collect_imports(t, c, out);
  }
}

int symbol_at(const std::vector<SymbolSpec>& syms, int start, int end, int current) {
  for (size_t i = 0; i < syms.size(); ++i) {
    if ((int)i == current || syms[i].kind == "import") continue;
    if (syms[i].start_line == start && syms[i].end_line == end) return (int)i;
  }
  return current;
}

std::vector<std::string> target_names(const SyntaxTree& t, TSNode node) {
  std::vector<std::string> out;
  if (t.language().is_identifier(ts_node_type(node))) {
    out.push_back(node_text(t, node));
    return out;
  }
  uint32_t count = ts_node_named_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    TSNode id = rightmost_identifier(t, ts_node_named_child(node, i));
    if (!ts_node_is_null(id)) out.push_back(node_text(t, id));
  }
  return out;
}

std::string callee_name(const SyntaxTree& t, TSNode node) {
  static const char* const fields[] = {"function", "name", "constructor", "macro"};
  for (auto* f : fields) {
    TSNode c = field(node, f);
    if (ts_node_is_null(c)) continue;
    TSNode id = rightmost_identifier(t, c);
    if (!ts_node_is_null(id)) return node_text(t, id);
  }
  if (ts_node_named_child_count(node) == 0) return "";
  TSNode id = rightmost_identifier(t, ts_node_named_child(node, 0));
  return ts_node_is_null(id) ? "" : node_text(t, id);
}

std::vector<EdgeSpec> edges_at(const SyntaxTree& t, TSNode node, NodeCategory cat,
                               const WalkContext& ctx, const std::vector<SymbolSpec>& syms) {
  std::vector<EdgeSpec> out;
  if (ctx.enclosing < 0) return out;
  const std::string& src = syms[ctx.enclosing].name;
  switch (cat) {
    case NodeCategory::Call: {
      std::string dst = callee_name(t, node);
      if (!dst.empty()) out.push_back({ctx.enclosing, src, dst, EdgeType::Calls});
      break;
    }
    case NodeCategory::Inherit:
      for (auto& dst : target_names(t, node)) out.push_back({ctx.enclosing, src, dst, EdgeType::Inherits});
      break;
    case NodeCategory::Implements:
      for (auto& dst : target_names(t, node)) out.push_back({ctx.enclosing, src, dst, EdgeType::Implements});
      break;
    case NodeCategory::Member: {
      // a field names its container
      std::string name = symbol_name(t, node);
      if (!name.empty() && name != "unknown") out.push_back({-1, name, src, EdgeType::MemberOf});
      break;
    }
    case NodeCategory::Export: {
      TSNode decl = field(node, "declaration");
      std::string dst = ts_node_is_null(decl) ? "" : symbol_name(t, decl);
      if (dst.empty()) {
        TSNode id = rightmost_identifier(t, node);
        if (!ts_node_is_null(id)) dst = node_text(t, id);
      }
      if (!dst.empty()) out.push_back({ctx.enclosing, src, dst, EdgeType::Exports});
      break;
    }
    default:
      break;
  }
  return out;
}

std::vector<EdgeSpec> visit(const SyntaxTree& t, TSNode node, const char* field_name,
                            const WalkContext& ctx, const std::vector<SymbolSpec>& syms) {
  NodeCategory cat = t.language().classify(ts_node_type(node), field_name);
  if (cat == NodeCategory::Import) return {};

  WalkContext inner = ctx;
  if (cat == NodeCategory::Function || cat == NodeCategory::Class) {
    inner = WalkContext{symbol_at(syms, start_line(node), end_line(node), ctx.enclosing), ctx.depth + 1};
  }
  std::vector<EdgeSpec> out = edges_at(t, node, cat, inner, syms);

  uint32_t count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    TSNode c = ts_node_child(node, i);
    if (!ts_node_is_named(c)) continue;
    auto sub = visit(t, c, field_of(node, i), inner, syms);
    out.insert(out.end(), sub.begin(), sub.end());
  }
  return out;
}

} // namespace

SyntaxTree::SyntaxTree(TSTree* tree, std::string source, const LanguageSpec* lang)
  : tree_(tree), source_(std::move(source)), lang_(lang) {
  lines_ = split_lines(source_);
}

SyntaxTree::~SyntaxTree() {
  if (tree_) ts_tree_delete(tree_);
}

bool ParserAdapter::supports(const std::string& lang) const {
  return find_language(lang) != nullptr;
}

std::unique_ptr<SyntaxTree> ParserAdapter::parse(const std::string& text, const std::string& lang) const {
  const LanguageSpec* spec = find_language(lang);
  if (!spec) return nullptr;
  std::unique_ptr<TSParser, void (*)(TSParser*)> parser(ts_parser_new(), ts_parser_delete);
  if (!ts_parser_set_language(parser.get(), spec->grammar())) return nullptr;
  TSTree* tree = ts_parser_parse_string(parser.get(), nullptr, text.data(), (uint32_t)text.size());
  if (!tree) return nullptr;
  auto out = std::make_unique<SyntaxTree>(tree, text, spec);
  if (std::strcmp(ts_node_type(ts_tree_root_node(tree)), "ERROR") == 0) return nullptr;
  return out;
}

std::vector<ChunkSpec> ParserAdapter::chunks(const SyntaxTree& tree) const {
  std::vector<Decl> decls;
  collect_decls(tree, ts_tree_root_node(tree.raw()), false, decls);
  std::vector<ChunkSpec> out;
  out.reserve(decls.size());
  for (auto& d : decls) {
    ChunkSpec c;
    c.start_line = start_line(d.node);
    c.end_line = end_line(d.node);
    c.text = slice_lines(tree, c.start_line, c.end_line);
    c.kind = d.kind;
    out.push_back(std::move(c));
  }
  return out;
}

std::vector<SymbolSpec> ParserAdapter::symbols(const SyntaxTree& tree) const {
  std::vector<Decl> decls;
  collect_decls(tree, ts_tree_root_node(tree.raw()), false, decls);
  std::vector<SymbolSpec> out;
  out.reserve(decls.size());
  for (auto& d : decls) {
    SymbolSpec s;
    s.name = symbol_name(tree, d.node);
    s.kind = d.kind;
    s.signature = first_line(tree, d.node);
    s.start_line = start_line(d.node);
    s.end_line = end_line(d.node);
    s.doc = doc_for(tree, d.node);
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<ImportSpec> ParserAdapter::imports(const SyntaxTree& tree) const {
  std::vector<TSNode> nodes;
  collect_imports(tree, ts_tree_root_node(tree.raw()), nodes);
  std::vector<ImportSpec> out;
  for (auto& n : nodes) {
    for (auto& [module, name] : tree.language().import_names(node_text(tree, n))) {
      out.push_back(ImportSpec{module, name, start_line(n)});
    }
  }
  return out;
}

std::vector<EdgeSpec> ParserAdapter::edges(const SyntaxTree& tree,
                                           const std::vector<SymbolSpec>& symbols) const {
  return visit(tree, ts_tree_root_node(tree.raw()), "", WalkContext{-1, 0}, symbols);
}

std::vector<int> infer_parents(const std::vector<SymbolSpec>& symbols) {
  std::vector<int> parents(symbols.size(), -1);
  for (size_t i = 0; i < symbols.size(); ++i) {
    const auto& s = symbols[i];
    int best = -1;
    int best_span = 0;
    for (size_t j = 0; j < symbols.size(); ++j) {
      if (j == i || symbols[j].kind == "import") continue;
      const auto& p = symbols[j];
      if (p.start_line > s.start_line || p.end_line < s.end_line) continue;
      int span = p.end_line - p.start_line;
      if (span == s.end_line - s.start_line && j > i) continue;
      if (best < 0 || span < best_span) {
        best = (int)j;
        best_span = span;
      }
    }
    parents[i] = best;
  }
  return parents;
}
