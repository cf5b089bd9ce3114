#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

std::string hex_from_bytes(const unsigned char* data, std::size_t size);

// Join key for entries of two trees: the generic form of a root-relative path.
std::string relative_key(const std::filesystem::path& relative);

// Absolute, lexically normalized, without a trailing separator.
std::filesystem::path normalize_root(const std::filesystem::path& root);

bool is_unsigned_integer(const std::string& text);
