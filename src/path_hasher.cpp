#include "path_hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext make_context(const std::filesystem::path& path) {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw IOError(path, "unable to initialise SHA-256");
  }
  return ctx;
}

} // namespace

std::string ContentDigest::hex() const {
  return hex_from_bytes(bytes_.data(), bytes_.size());
}

ContentDigest PathHasher::digest(const std::filesystem::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if(!in) throw IOError(path, "unable to open for hashing");

  auto ctx = make_context(path);

  std::vector<char> buffer(kChunkSize);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = in.gcount();
    if(read > 0) {
      if(EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(read)) != 1) {
        throw IOError(path, "SHA-256 update failed");
      }
    }
  }
  if(in.bad()) throw IOError(path, "read failed while hashing");

  ContentDigest::Bytes bytes{};
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx.get(), bytes.data(), &length) != 1 || length != bytes.size()) {
    throw IOError(path, "SHA-256 finalisation failed");
  }
  return ContentDigest(bytes);
}

bool PathHasher::equal_content(const std::filesystem::path& a, const std::filesystem::path& b) const {
  return digest(a) == digest(b);
}
