#include "ContentHash.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace sgw {

namespace {

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

MdCtxPtr new_sha256_ctx() {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return ctx;
}

std::string finish_base64url(EVP_MD_CTX* ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  std::string b64(4 * ((len + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(b64.data()), digest,
                                static_cast<int>(len));
  b64.resize(static_cast<size_t>(n));
  while (!b64.empty() && b64.back() == '=') b64.pop_back();
  for (auto& c : b64) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return b64;
}

} // namespace

std::string content_hash_of(std::string_view bytes) {
  auto ctx = new_sha256_ctx();
  if (EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return finish_base64url(ctx.get());
}

std::string content_hash_of_file(const std::string& path) {
  std::ifstream is(path, std::ios::binary);
  if (!is) throw std::runtime_error("cannot open " + path);

  auto ctx = new_sha256_ctx();
  std::vector<char> buf(1024 * 1024);
  while (is) {
    is.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = is.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  if (is.bad()) throw std::runtime_error("read failed in " + path);
  return finish_base64url(ctx.get());
}

} // namespace sgw
