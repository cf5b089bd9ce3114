#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>

// SHA-256 of a file's full byte stream.
class ContentDigest {
public:
  static constexpr std::size_t kSize = 32;
  using Bytes = std::array<unsigned char, kSize>;

  ContentDigest() = default;
  explicit ContentDigest(const Bytes& bytes) : bytes_(bytes) {}

  const Bytes& bytes() const { return bytes_; }
  std::string hex() const;

  bool operator==(const ContentDigest& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ContentDigest& other) const { return bytes_ != other.bytes_; }

private:
  Bytes bytes_{};
};

class PathHasher {
public:
  static constexpr std::size_t kChunkSize = 64 * 1024;

  // Streams the file through SHA-256. Throws IOError when the file cannot
  // be opened or a read fails part way.
  ContentDigest digest(const std::filesystem::path& path) const;

  bool equal_content(const std::filesystem::path& a, const std::filesystem::path& b) const;
};
