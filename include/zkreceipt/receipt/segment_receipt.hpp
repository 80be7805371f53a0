#pragma once
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/primitives.hpp>
#include <zkreceipt/schema/receipt_claim.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace zkreceipt::receipt {

/// Proof of a single execution segment.
struct segment_receipt_t final {
  /// Opaque STARK seal attesting to the segment's execution.
  zkreceipt::schema::words_t seal;

  /// Segment index within its composite receipt.
  uint32_t index{};

  /// Name of the hash suite the seal was produced with.
  std::string hashfn;

  /// Fingerprint of the proof system / circuit version; not the parameters
  /// themselves, which come from a trusted source.
  zkreceipt::schema::digest_t verifier_parameters;

  zkreceipt::schema::receipt_claim_t claim;

  zkreceipt::schema::bytes_t seal_bytes() const;
  std::size_t seal_size() const;

  bool operator==(const segment_receipt_t&) const = default;
};

}  // namespace zkreceipt::receipt
