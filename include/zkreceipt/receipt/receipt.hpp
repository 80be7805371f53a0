#pragma once
#include <zkreceipt/receipt/inner_receipt.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>
#include <zkreceipt/schema/primitives.hpp>
#include <zkreceipt/schema/receipt_claim.hpp>

namespace zkreceipt::receipt {

/// Raw bytes the guest committed to, carried beside the seal.
struct journal_t final {
  zkreceipt::schema::bytes_t bytes;

  bool operator==(const journal_t&) const = default;
};

struct receipt_metadata_t final {
  /// Lets a caller pick a compatible verifier when several proof system
  /// versions are in use.
  zkreceipt::schema::digest_t verifier_parameters;

  bool operator==(const receipt_metadata_t&) const = default;
};

/// Top-level artifact a verifier consumes.
struct receipt_t final {
  inner_receipt_t inner;
  journal_t journal;
  receipt_metadata_t metadata;

  zkreceipt::schema::maybe_pruned<zkreceipt::schema::receipt_claim_t> claim()
      const;

  bool operator==(const receipt_t&) const = default;
};

}  // namespace zkreceipt::receipt
