#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace raptorboost {

// Raw 32-byte SHA-256 digest (binary, not hex)
using digest = std::array<std::uint8_t, 32>;

/** Compute SHA-256 of arbitrary bytes. */
digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Hash a whole file without loading it into memory. */
digest sha256_file(const std::filesystem::path &p);

// Incremental SHA-256 for data that arrives in pieces.
class Sha256Hasher {
public:
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher &) = delete;
  auto operator=(const Sha256Hasher &) -> Sha256Hasher & = delete;

  void update(std::span<const std::uint8_t> data);
  // Produces the digest; the hasher must not be updated afterwards.
  digest finish();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const noexcept;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

/** Convert binary digest to 64-char lowercase hex. */
std::string to_hex(const digest &d);

// Exactly 64 characters of lowercase hex, the only form accepted on the wire.
auto looks_sha256_hex(std::string_view str) -> bool;

// Throws InvalidDigest unless looks_sha256_hex(hex).
void require_sha256_hex(std::string_view hex);

} // namespace raptorboost
