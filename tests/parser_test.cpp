#include "parser.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace {

const char* PY_SOURCE =
  "import os\n"
  "from pkg.util import load as ld, save\n"
  "\n"
  "class Greeter(Base):\n"
  "    \"\"\"Says hello.\"\"\"\n"
  "    def hello(self):\n"
  "        return helper()\n"
  "\n"
  "def helper():\n"
  "    return os.getcwd()\n";

bool has_edge(const std::vector<EdgeSpec>& edges, const std::string& src, const std::string& dst, EdgeType t) {
  return std::any_of(edges.begin(), edges.end(), [&](const EdgeSpec& e) {
    return e.src == src && e.dst == dst && e.type == t;
  });
}

} // namespace

TEST(Parser, SingleFunctionGivesOneChunkAndOneSymbol) {
  ParserAdapter p;
  auto tree = p.parse("def foo():\n    return 1\n", "python");
  ASSERT_TRUE(tree);
  auto chunks = p.chunks(*tree);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].kind, "function");
  EXPECT_EQ(chunks[0].start_line, 1);
  EXPECT_EQ(chunks[0].end_line, 2);
  EXPECT_NE(chunks[0].text.find("return 1"), std::string::npos);

  auto syms = p.symbols(*tree);
  ASSERT_EQ(syms.size(), 1u);
  EXPECT_EQ(syms[0].name, "foo");
  EXPECT_EQ(syms[0].signature, "def foo():");
}

TEST(Parser, PythonClassesMethodsAndDocstrings) {
  ParserAdapter p;
  auto tree = p.parse(PY_SOURCE, "python");
  ASSERT_TRUE(tree);
  auto syms = p.symbols(*tree);
  ASSERT_EQ(syms.size(), 3u);
  EXPECT_EQ(syms[0].name, "Greeter");
  EXPECT_EQ(syms[0].kind, "class");
  EXPECT_EQ(syms[0].start_line, 4);
  EXPECT_EQ(syms[0].end_line, 7);
  EXPECT_NE(syms[0].doc.find("Says hello."), std::string::npos);
  EXPECT_EQ(syms[1].name, "hello");
  EXPECT_EQ(syms[1].kind, "method");
  EXPECT_EQ(syms[2].name, "helper");
  EXPECT_EQ(syms[2].kind, "function");

  auto parents = infer_parents(syms);
  EXPECT_EQ(parents, (std::vector<int>{-1, 0, -1}));
}

TEST(Parser, PythonImportsOnePerName) {
  ParserAdapter p;
  auto tree = p.parse(PY_SOURCE, "python");
  ASSERT_TRUE(tree);
  auto imports = p.imports(*tree);
  ASSERT_EQ(imports.size(), 3u);
  EXPECT_EQ(imports[0].module, "os");
  EXPECT_EQ(imports[0].line, 1);
  EXPECT_EQ(imports[1].module, "pkg.util");
  EXPECT_EQ(imports[1].name, "load");
  EXPECT_EQ(imports[2].name, "save");
  EXPECT_EQ(imports[2].line, 2);
}

TEST(Parser, PythonEdgesComeFromTheEnclosingSymbol) {
  ParserAdapter p;
  auto tree = p.parse(PY_SOURCE, "python");
  ASSERT_TRUE(tree);
  auto syms = p.symbols(*tree);
  auto edges = p.edges(*tree, syms);
  EXPECT_TRUE(has_edge(edges, "hello", "helper", EdgeType::Calls));
  EXPECT_TRUE(has_edge(edges, "helper", "getcwd", EdgeType::Calls));
  EXPECT_TRUE(has_edge(edges, "Greeter", "Base", EdgeType::Inherits));
  for (auto& e : edges) {
    ASSERT_GE(e.src_index, 0);
    EXPECT_EQ(syms[(size_t)e.src_index].name, e.src);
  }
}

TEST(Parser, JavaScriptClassesAndImports) {
  ParserAdapter p;
  auto tree = p.parse(
    "import { readFile } from 'fs';\n"
    "class Reader extends Base {\n"
    "  load(path) {\n"
    "    return readFile(path);\n"
    "  }\n"
    "}\n"
    "function main() {\n"
    "  return new Reader();\n"
    "}\n", "javascript");
  ASSERT_TRUE(tree);
  auto syms = p.symbols(*tree);
  ASSERT_EQ(syms.size(), 3u);
  EXPECT_EQ(syms[0].name, "Reader");
  EXPECT_EQ(syms[1].name, "load");
  EXPECT_EQ(syms[1].kind, "method");
  EXPECT_EQ(syms[2].name, "main");

  auto imports = p.imports(*tree);
  ASSERT_EQ(imports.size(), 1u);
  EXPECT_EQ(imports[0].module, "fs");
  EXPECT_EQ(imports[0].name, "readFile");

  auto edges = p.edges(*tree, syms);
  EXPECT_TRUE(has_edge(edges, "load", "readFile", EdgeType::Calls));
  EXPECT_TRUE(has_edge(edges, "main", "Reader", EdgeType::Calls));
  EXPECT_TRUE(has_edge(edges, "Reader", "Base", EdgeType::Inherits));
}

TEST(Parser, UnsupportedLanguageYieldsNothing) {
  ParserAdapter p;
  EXPECT_FALSE(p.supports("cobol"));
  EXPECT_EQ(p.parse("IDENTIFICATION DIVISION.", "cobol"), nullptr);
  EXPECT_TRUE(p.supports("python"));
  auto langs = supported_languages();
  EXPECT_NE(std::find(langs.begin(), langs.end(), "rust"), langs.end());
}

TEST(Parser, ParentsPreferTheSmallestEnclosingSpan) {
  std::vector<SymbolSpec> syms(4);
  syms[0] = {"Outer", "class", "", 1, 20, ""};
  syms[1] = {"Inner", "class", "", 2, 10, ""};
  syms[2] = {"run", "method", "", 3, 5, ""};
  syms[3] = {"twin", "function", "", 3, 5, ""};
  auto parents = infer_parents(syms);
  EXPECT_EQ(parents[0], -1);
  EXPECT_EQ(parents[1], 0);
  EXPECT_EQ(parents[2], 1);
  EXPECT_EQ(parents[3], 2);
}
