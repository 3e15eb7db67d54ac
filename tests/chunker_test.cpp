#include "chunker.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

TEST(Chunker, DetectsLanguageFromExtension) {
  EXPECT_EQ(detect_language("a/b/core.py"), "python");
  EXPECT_EQ(detect_language("README.MD"), "markdown");
  EXPECT_EQ(detect_language("lib.hpp"), "cpp");
  EXPECT_EQ(detect_language("conf.toml"), "toml");
  EXPECT_EQ(detect_language("Makefile"), "unknown");
  EXPECT_EQ(detect_language(".gitignore"), "unknown");
  EXPECT_TRUE(is_text_format("rst"));
  EXPECT_FALSE(is_text_format("python"));
}

TEST(Chunker, ListsSourceFilesSortedAndFiltered) {
  TempTree t;
  t.write("b.py", "x = 1\n");
  t.write("a/c.js", "let y = 2;\n");
  t.write("node_modules/dep/index.js", "module.exports = 1;\n");
  t.write("img.png", "not really a png");
  t.write("blob.dat", std::string("\x01\x02\0\x03", 4));
  t.write("notes.log", "log line\n");
  t.write(".gitignore", "*.log\n");
  auto files = list_source_files(t.path(), ExclusionRules::defaults());
  EXPECT_EQ(files, (std::vector<std::string>{".gitignore", "a/c.js", "b.py"}));
}

TEST(Chunker, ParagraphsSplitOnBlankLines) {
  auto chunks = paragraph_chunks("# Title\nintro line\n\nsecond para\n  \nthird\n");
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].start_line, 1);
  EXPECT_EQ(chunks[0].end_line, 2);
  EXPECT_EQ(chunks[0].text, "# Title\nintro line");
  EXPECT_EQ(chunks[1].start_line, 4);
  EXPECT_EQ(chunks[1].end_line, 4);
  EXPECT_EQ(chunks[2].start_line, 6);
  EXPECT_EQ(chunks[2].kind, "paragraph");
}

TEST(Chunker, TextWithoutBlankLinesIsOneBlock) {
  auto chunks = paragraph_chunks("one\ntwo\n");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].kind, "block");
  EXPECT_EQ(chunks[0].end_line, 2);
  EXPECT_TRUE(paragraph_chunks("").empty());
  EXPECT_TRUE(whole_file_chunk("").empty());
}
