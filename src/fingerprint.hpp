#pragma once
#include <optional>
#include <string>
#include <vector>

// "sha256:<hex>" digest of normalized content; nullopt means absent.
using Hash = std::optional<std::string>;

std::vector<unsigned char> sha256(const std::string& data);
std::string hex_encode(const std::vector<unsigned char>& data);

// CRLF -> LF, drop a leading UTF-8 BOM, trim trailing whitespace on every line.
std::string normalize_content(const std::string& content);

std::string normalized_hash(const std::string& content);
Hash hash_file(const std::string& path);

// Absence is never equal to anything, including another absence.
bool hash_equal(const Hash& a, const Hash& b);
