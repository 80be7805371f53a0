#pragma once
#include <zkreceipt/receipt/fake_receipt.hpp>
#include <zkreceipt/receipt/groth16_receipt.hpp>
#include <zkreceipt/receipt/segment_receipt.hpp>
#include <zkreceipt/receipt/succinct_receipt.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/input.hpp>
#include <zkreceipt/schema/receipt_claim.hpp>

#include <string_view>
#include <variant>
#include <vector>

namespace zkreceipt::receipt {

struct inner_assumption_receipt_t;

/// Multi-segment proof of one execution plus receipts for the claims it
/// assumed.
struct composite_receipt_t final {
  static constexpr auto kName = std::string_view{"Composite"};

  std::vector<segment_receipt_t> segments;

  /// One receipt per assumption made within the segments, in order.
  std::vector<inner_assumption_receipt_t> assumption_receipts;

  zkreceipt::schema::digest_t verifier_parameters;

  /// Claim covering the whole execution: pre state and input of the first
  /// segment, post state and exit code of the last, and the last segment's
  /// output with its assumptions resolved to an empty list.
  ///
  /// Throws receipt_format_error when there are no segments or the last
  /// output is pruned.
  zkreceipt::schema::receipt_claim_t claim() const;

  bool operator==(const composite_receipt_t& other) const;
};

/// Receipt backing one assumption.
struct inner_assumption_receipt_t final {
  using variant_t =
      std::variant<composite_receipt_t,
                   succinct_receipt_t<zkreceipt::schema::unknown_claim_t>,
                   groth16_receipt_t<zkreceipt::schema::unknown_claim_t>,
                   fake_receipt_t<zkreceipt::schema::unknown_claim_t>>;

  variant_t value;

  std::string_view name() const;

  /// Digest of the assumed claim.
  zkreceipt::schema::digest_t claim_digest(
      const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const inner_assumption_receipt_t&) const = default;
};

}  // namespace zkreceipt::receipt
