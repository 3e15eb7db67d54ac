#pragma once
#include <string>

// Lowercase hex SHA-256 of arbitrary bytes.
std::string sha256_hex(const std::string& data);
