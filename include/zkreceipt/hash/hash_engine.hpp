#pragma once
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace zkreceipt::hash {

/// One 512-bit compression block as sixteen machine-native words.
using block_t = std::array<uint32_t, zkreceipt::schema::kBlockWords>;

/// SHA-256 initial chaining state (FIPS 180-4, section 5.3.3).
zkreceipt::schema::digest_t sha256_init();

/// SHA-256 family operations consumed by the tagged hashing and claim code.
///
/// Implementations are stateless; every call is independent and may be made
/// concurrently.
class hash_engine {
 public:
  virtual ~hash_engine() = default;

  /// Suite name as carried by the `hashfn` field of receipts.
  virtual std::string_view name() const = 0;

  /// Standard hash of a byte string, padded and with the length trailer.
  virtual zkreceipt::schema::digest_t hash_bytes(
      const zkreceipt::schema::bytes_view_t& bytes) const = 0;

  /// hash_bytes over the in-memory bytes of `words`.
  zkreceipt::schema::digest_t hash_words(
      const zkreceipt::schema::words_view_t& words) const;

  /// Node hash for Merkle paths. Not the standard hash of any preimage.
  virtual zkreceipt::schema::digest_t hash_pair(
      const zkreceipt::schema::digest_t& a,
      const zkreceipt::schema::digest_t& b) const;

  /// Raw compression of one block given as two (not necessarily adjacent)
  /// halves, continuing from `state`.
  virtual zkreceipt::schema::digest_t compress(
      const zkreceipt::schema::digest_t& state,
      const zkreceipt::schema::digest_t& block_half1,
      const zkreceipt::schema::digest_t& block_half2) const = 0;

  /// Merkle-Damgard iteration of compress over `blocks`.
  virtual zkreceipt::schema::digest_t compress_slice(
      const zkreceipt::schema::digest_t& state,
      const std::span<const block_t>& blocks) const = 0;

  /// Zero-pads to the block boundary but adds no length trailer; not a
  /// standards compliant hash.
  virtual zkreceipt::schema::digest_t hash_raw_data_slice(
      const zkreceipt::schema::bytes_view_t& data) const = 0;
};

}  // namespace zkreceipt::hash
