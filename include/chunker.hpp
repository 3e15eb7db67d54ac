#pragma once
#include "filters.hpp"
#include "parser.hpp"
#include <string>
#include <vector>

// Language label from the file extension; the bare extension when unknown.
std::string detect_language(const std::string& path);

// markdown, text and rst are chunked by paragraph.
bool is_text_format(const std::string& lang);

// Relative '/' separated paths of every non-excluded, non-binary file, sorted.
std::vector<std::string> list_source_files(const std::string& root, const ExclusionRules& rules);

// Splits on blank lines. A text without blank lines becomes one "block".
std::vector<ChunkSpec> paragraph_chunks(const std::string& text);

// Whole-file fallback for unparsed files. Empty text yields no chunk.
std::vector<ChunkSpec> whole_file_chunk(const std::string& text);
