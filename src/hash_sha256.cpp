#include "raptorboost/hash.hpp"
#include "raptorboost/consts.hpp"
#include "raptorboost/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace raptorboost {

void Sha256Hasher::CtxDeleter::operator()(evp_md_ctx_st *ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_{EVP_MD_CTX_new()} {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha256) failed");
  }
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::update(std::span<const std::uint8_t> data) {
  if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

digest Sha256Hasher::finish() {
  digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-256 produced unexpected length");
  }
  return out;
}

digest sha256(std::span<const std::uint8_t> data) {
  Sha256Hasher h;
  h.update(data);
  return h.finish();
}

digest sha256_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for hashing failed: " + p.string());
  }
  Sha256Hasher h;
  std::vector<std::uint8_t> buf(64 * 1024);
  while (ifs) {
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
    const auto n = static_cast<std::size_t>(ifs.gcount());
    if (n == 0) {
      break;
    }
    h.update(std::span<const std::uint8_t>(buf.data(), n));
  }
  if (ifs.bad()) {
    throw std::runtime_error("read for hashing failed: " + p.string());
  }
  return h.finish();
}

std::string to_hex(const digest &d) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kDigestHexLen);
  for (std::size_t i = 0; i < consts::kDigestRawLen; ++i) {
    unsigned b = d[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool looks_sha256_hex(std::string_view str) {
  if (str.size() != consts::kDigestHexLen) {
    return false;
  }
  return std::ranges::all_of(str, [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

void require_sha256_hex(std::string_view hex) {
  if (!looks_sha256_hex(hex)) {
    throw InvalidDigest(std::string(hex));
  }
}

} // namespace raptorboost
