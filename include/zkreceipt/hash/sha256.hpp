#pragma once
#include <zkreceipt/hash/hash_engine.hpp>

namespace zkreceipt::hash {

/// SHA-256 suite backed by OpenSSL.
class sha256_engine final : public hash_engine {
 public:
  static constexpr std::string_view kName{"sha-256"};

  std::string_view name() const override;

  zkreceipt::schema::digest_t hash_bytes(
      const zkreceipt::schema::bytes_view_t& bytes) const override;

  zkreceipt::schema::digest_t compress(
      const zkreceipt::schema::digest_t& state,
      const zkreceipt::schema::digest_t& block_half1,
      const zkreceipt::schema::digest_t& block_half2) const override;

  zkreceipt::schema::digest_t compress_slice(
      const zkreceipt::schema::digest_t& state,
      const std::span<const block_t>& blocks) const override;

  zkreceipt::schema::digest_t hash_raw_data_slice(
      const zkreceipt::schema::bytes_view_t& data) const override;
};

}  // namespace zkreceipt::hash
