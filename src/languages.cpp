// Grammar registrations for the parser adapter.
#include "parser.hpp"
#include "text_util.hpp"
#include <re2/re2.h>
#include <tree_sitter/api.h>
#include <cstring>

extern "C" {
const TSLanguage* tree_sitter_python();
const TSLanguage* tree_sitter_javascript();
const TSLanguage* tree_sitter_go();
const TSLanguage* tree_sitter_java();
const TSLanguage* tree_sitter_c();
const TSLanguage* tree_sitter_cpp();
const TSLanguage* tree_sitter_rust();
}

using Names = std::vector<std::pair<std::string, std::string>>;

namespace {

bool eq(const char* a, const char* b) { return std::strcmp(a, b) == 0; }

template <size_t N>
bool any_of(const char* t, const char* const (&set)[N]) {
  for (auto* s : set) if (eq(t, s)) return true;
  return false;
}

std::vector<std::string> split_list(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == sep) { out.push_back(trim(cur)); cur.clear(); }
    else cur.push_back(c);
  }
  out.push_back(trim(cur));
  return out;
}

// "a as b" -> "a"
std::string strip_alias(const std::string& s) {
  static const RE2 alias("^\\s*(\\S+)\\s+as\\s+\\S+\\s*$");
  std::string base;
  if (RE2::FullMatch(s, alias, &base)) return base;
  return trim(s);
}

std::string last_segment(const std::string& s, const std::string& sep) {
  auto p = s.rfind(sep);
  return p == std::string::npos ? s : s.substr(p + sep.size());
}

std::string strip_parens(std::string s) {
  for (auto& c : s) if (c == '(' || c == ')' || c == '\n' || c == '\r' || c == '\\') c = ' ';
  return s;
}

// --- python ---

NodeCategory python_classify(const char* type, const char* field) {
  if (eq(field, "superclasses")) return NodeCategory::Inherit;
  if (eq(type, "function_definition")) return NodeCategory::Function;
  if (eq(type, "class_definition")) return NodeCategory::Class;
  if (eq(type, "import_statement") || eq(type, "import_from_statement")) return NodeCategory::Import;
  if (eq(type, "call")) return NodeCategory::Call;
  return NodeCategory::None;
}

bool python_identifier(const char* type) { return eq(type, "identifier"); }

Names python_imports(const std::string& text) {
  static const RE2 from_re("(?s)^\\s*from\\s+([\\w\\.]+)\\s+import\\s+(.+)$");
  static const RE2 import_re("(?s)^\\s*import\\s+(.+)$");
  Names out;
  std::string module, rest;
  if (RE2::FullMatch(text, from_re, &module, &rest)) {
    for (auto& part : split_list(strip_parens(rest), ',')) {
      std::string name = strip_alias(part);
      if (name.empty() || name == "*") continue;
      out.emplace_back(module, name);
    }
  } else if (RE2::FullMatch(text, import_re, &rest)) {
    for (auto& part : split_list(strip_parens(rest), ',')) {
      std::string mod = strip_alias(part);
      if (mod.empty()) continue;
      out.emplace_back(mod, last_segment(mod, "."));
    }
  }
  return out;
}

// --- javascript ---

NodeCategory js_classify(const char* type, const char* field) {
  (void)field;
  static const char* const functions[] = {"function_declaration", "generator_function_declaration",
                                          "method_definition"};
  if (any_of(type, functions)) return NodeCategory::Function;
  if (eq(type, "class_declaration")) return NodeCategory::Class;
  if (eq(type, "import_statement")) return NodeCategory::Import;
  if (eq(type, "call_expression") || eq(type, "new_expression")) return NodeCategory::Call;
  if (eq(type, "class_heritage")) return NodeCategory::Inherit;
  if (eq(type, "field_definition")) return NodeCategory::Member;
  if (eq(type, "export_statement")) return NodeCategory::Export;
  return NodeCategory::None;
}

bool js_identifier(const char* type) {
  static const char* const ids[] = {"identifier", "property_identifier", "type_identifier"};
  return any_of(type, ids);
}

Names js_imports(const std::string& text) {
  static const RE2 from_re("from\\s+['\"]([^'\"]+)['\"]");
  static const RE2 bare_re("^\\s*import\\s+['\"]([^'\"]+)['\"]");
  static const RE2 braces_re("\\{([^}]*)\\}");
  static const RE2 default_re("^\\s*import\\s+([A-Za-z_$][\\w$]*)\\s*(?:,|from)");
  static const RE2 ns_re("\\*\\s*as\\s+([A-Za-z_$][\\w$]*)");
  Names out;
  std::string module;
  if (!RE2::PartialMatch(text, from_re, &module) && !RE2::PartialMatch(text, bare_re, &module))
    return out;
  std::string inner, name;
  if (RE2::PartialMatch(text, braces_re, &inner)) {
    for (auto& part : split_list(inner, ',')) {
      std::string n = strip_alias(part);
      if (!n.empty()) out.emplace_back(module, n);
    }
  }
  if (RE2::PartialMatch(text, default_re, &name)) out.emplace_back(module, name);
  if (RE2::PartialMatch(text, ns_re, &name)) out.emplace_back(module, name);
  if (out.empty()) {
    std::string stem = last_segment(module, "/");
    auto dot = stem.find('.');
    out.emplace_back(module, dot == std::string::npos ? stem : stem.substr(0, dot));
  }
  return out;
}

// --- go ---

NodeCategory go_classify(const char* type, const char* field) {
  (void)field;
  if (eq(type, "function_declaration") || eq(type, "method_declaration")) return NodeCategory::Function;
  if (eq(type, "type_declaration")) return NodeCategory::Class;
  if (eq(type, "import_spec")) return NodeCategory::Import;
  if (eq(type, "call_expression")) return NodeCategory::Call;
  if (eq(type, "field_declaration")) return NodeCategory::Member;
  return NodeCategory::None;
}

bool go_identifier(const char* type) {
  static const char* const ids[] = {"identifier", "field_identifier", "type_identifier",
                                    "package_identifier"};
  return any_of(type, ids);
}

Names go_imports(const std::string& text) {
  static const RE2 spec_re("^\\s*([\\w\\.]+)?\\s*\"([^\"]+)\"");
  Names out;
  std::string alias, path;
  if (RE2::PartialMatch(text, spec_re, &alias, &path)) {
    std::string name = (alias.empty() || alias == "_" || alias == ".") ? last_segment(path, "/") : alias;
    out.emplace_back(path, name);
  }
  return out;
}

// --- java ---

NodeCategory java_classify(const char* type, const char* field) {
  if (eq(field, "superclass")) return NodeCategory::Inherit;
  if (eq(field, "interfaces")) return NodeCategory::Implements;
  if (eq(type, "extends_interfaces")) return NodeCategory::Inherit;
  if (eq(type, "method_declaration") || eq(type, "constructor_declaration")) return NodeCategory::Function;
  static const char* const classes[] = {"class_declaration", "interface_declaration", "enum_declaration"};
  if (any_of(type, classes)) return NodeCategory::Class;
  if (eq(type, "import_declaration")) return NodeCategory::Import;
  if (eq(type, "method_invocation") || eq(type, "object_creation_expression")) return NodeCategory::Call;
  if (eq(type, "field_declaration")) return NodeCategory::Member;
  return NodeCategory::None;
}

bool java_identifier(const char* type) {
  return eq(type, "identifier") || eq(type, "type_identifier");
}

Names java_imports(const std::string& text) {
  static const RE2 import_re("^\\s*import\\s+(?:static\\s+)?([\\w\\.]+?)(\\.\\*)?\\s*;");
  Names out;
  std::string path, star;
  if (!RE2::PartialMatch(text, import_re, &path, &star)) return out;
  if (!star.empty()) return out;
  auto dot = path.rfind('.');
  if (dot == std::string::npos) out.emplace_back(path, path);
  else out.emplace_back(path.substr(0, dot), path.substr(dot + 1));
  return out;
}

// --- c / c++ ---

NodeCategory c_classify(const char* type, const char* field) {
  (void)field;
  if (eq(type, "function_definition")) return NodeCategory::Function;
  if (eq(type, "preproc_include")) return NodeCategory::Import;
  if (eq(type, "call_expression")) return NodeCategory::Call;
  if (eq(type, "field_declaration")) return NodeCategory::Member;
  return NodeCategory::None;
}

NodeCategory cpp_classify(const char* type, const char* field) {
  if (eq(type, "class_specifier") || eq(type, "struct_specifier")) return NodeCategory::Class;
  if (eq(type, "base_class_clause")) return NodeCategory::Inherit;
  return c_classify(type, field);
}

bool c_identifier(const char* type) {
  static const char* const ids[] = {"identifier", "field_identifier", "type_identifier",
                                    "namespace_identifier"};
  return any_of(type, ids);
}

Names c_imports(const std::string& text) {
  static const RE2 include_re("#\\s*include\\s*[<\"]([^>\"]+)[>\"]");
  Names out;
  std::string header;
  if (RE2::PartialMatch(text, include_re, &header)) {
    std::string stem = last_segment(header, "/");
    auto dot = stem.rfind('.');
    out.emplace_back(header, dot == std::string::npos ? stem : stem.substr(0, dot));
  }
  return out;
}

// --- rust ---

NodeCategory rust_classify(const char* type, const char* field) {
  if (eq(field, "trait")) return NodeCategory::Implements;
  if (eq(type, "function_item")) return NodeCategory::Function;
  static const char* const classes[] = {"struct_item", "enum_item", "impl_item", "trait_item"};
  if (any_of(type, classes)) return NodeCategory::Class;
  if (eq(type, "use_declaration")) return NodeCategory::Import;
  if (eq(type, "call_expression") || eq(type, "macro_invocation")) return NodeCategory::Call;
  if (eq(type, "field_declaration")) return NodeCategory::Member;
  return NodeCategory::None;
}

bool rust_identifier(const char* type) {
  static const char* const ids[] = {"identifier", "type_identifier", "field_identifier"};
  return any_of(type, ids);
}

Names rust_imports(const std::string& text) {
  static const RE2 use_re("(?s)^\\s*(?:pub(?:\\([^)]*\\))?\\s+)?use\\s+(.+?)\\s*;?\\s*$");
  static const RE2 group_re("(?s)^(.*)::\\{(.*)\\}$");
  Names out;
  std::string path;
  if (!RE2::FullMatch(text, use_re, &path)) return out;
  std::string prefix, inner;
  if (RE2::FullMatch(path, group_re, &prefix, &inner)) {
    for (auto& part : split_list(strip_parens(inner), ',')) {
      std::string n = strip_alias(part);
      if (n.empty() || n == "*" || n == "self") continue;
      if (n.find("::") != std::string::npos) n = last_segment(n, "::");
      out.emplace_back(prefix, n);
    }
    return out;
  }
  path = strip_alias(path);
  auto sep = path.rfind("::");
  std::string name = last_segment(path, "::");
  if (name == "*") return out;
  out.emplace_back(sep == std::string::npos ? path : path.substr(0, sep), name);
  return out;
}

const LanguageSpec LANGUAGES[] = {
  {"python", tree_sitter_python, python_classify, python_identifier, python_imports},
  {"javascript", tree_sitter_javascript, js_classify, js_identifier, js_imports},
  {"go", tree_sitter_go, go_classify, go_identifier, go_imports},
  {"java", tree_sitter_java, java_classify, java_identifier, java_imports},
  {"c", tree_sitter_c, c_classify, c_identifier, c_imports},
  {"cpp", tree_sitter_cpp, cpp_classify, c_identifier, c_imports},
  {"rust", tree_sitter_rust, rust_classify, rust_identifier, rust_imports},
};

} // namespace

const LanguageSpec* find_language(const std::string& lang) {
  for (auto& l : LANGUAGES) if (lang == l.name) return &l;
  return nullptr;
}

std::vector<std::string> supported_languages() {
  std::vector<std::string> out;
  for (auto& l : LANGUAGES) out.push_back(l.name);
  return out;
}
