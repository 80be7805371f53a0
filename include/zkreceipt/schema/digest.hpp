#pragma once
#include <zkreceipt/schema/primitives.hpp>

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace zkreceipt::schema {

using digest_words_t = std::array<uint32_t, kDigestWords>;
using digest_bytes_t = std::array<uint8_t, kDigestBytes>;

/// Fixed-size 32-byte identifier produced by every hashing operation.
///
/// Stored as eight machine-native words; the byte view reinterprets them in
/// place. Comparison and hashing are byte-wise.
class digest_t final {
 public:
  constexpr digest_t() = default;
  constexpr explicit digest_t(const digest_words_t& words) : words_{words} {}

  static digest_t zero();

  /// Bytes are copied verbatim into the word storage.
  static digest_t from_bytes(const digest_bytes_t& bytes);
  static std::optional<digest_t> try_from_bytes(const bytes_view_t& bytes);

  /// Each word is laid out big-endian in memory, matching published hash
  /// constants written as 32-bit literals.
  static digest_t from_be_words(const digest_words_t& words);

  static std::optional<digest_t> try_from_hex(std::string_view hex);

  const digest_words_t& words() const { return words_; }
  digest_words_t& words() { return words_; }

  std::span<const uint8_t, kDigestBytes> bytes() const;

  std::string to_hex() const;

  friend bool operator==(const digest_t& lhs, const digest_t& rhs);
  friend std::strong_ordering operator<=>(const digest_t& lhs,
                                          const digest_t& rhs);

 private:
  digest_words_t words_{};
};

using digests_t = std::vector<digest_t>;

}  // namespace zkreceipt::schema

template <>
struct std::hash<zkreceipt::schema::digest_t> {
  std::size_t operator()(const zkreceipt::schema::digest_t& digest) const;
};
