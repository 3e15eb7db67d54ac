#pragma once
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string to_lower(std::string s);

// Lowercased runs of [A-Za-z0-9_] with at least `min_len` characters.
std::vector<std::string> word_tokens(const std::string& text, size_t min_len = 2);

// Splits on '\n'; a trailing newline does not produce an extra empty line.
std::vector<std::string> split_lines(const std::string& text);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
