#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // OpenSSL EVP_MD_CTX

namespace snapvc {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/** Compute SHA-1 of arbitrary bytes. */
digest sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/**
 * Incremental SHA-1, for hashing a whole snapshot tree without
 * concatenating it in memory first:
 *   Sha1 h;
 *   h.update(path); h.update(bytes);
 *   auto hex = to_hex(h.finish());
 */
class Sha1 {
public:
  Sha1();
  ~Sha1();
  Sha1(const Sha1 &) = delete;
  Sha1 &operator=(const Sha1 &) = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }

  // Finalize; the hasher cannot be updated afterwards.
  digest finish();

private:
  evp_md_ctx_st *ctx_;
  bool finished_ = false;
};

/** Convert binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &d);

// True if every character is a hex digit (either case); empty is false.
bool is_hex(std::string_view str);

// Lowercase copy of an ASCII string
std::string ascii_lower(std::string_view str);

} // namespace snapvc
