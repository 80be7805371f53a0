#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/receipt/composite_receipt.hpp>
#include <zkreceipt/receipt/fake_receipt.hpp>
#include <zkreceipt/receipt/groth16_receipt.hpp>
#include <zkreceipt/receipt/succinct_receipt.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>
#include <zkreceipt/schema/receipt_claim.hpp>

#include <string_view>
#include <variant>

namespace zkreceipt::receipt {

/// Proof strategy backing a top-level receipt.
struct inner_receipt_t final {
  using variant_t =
      std::variant<composite_receipt_t,
                   succinct_receipt_t<zkreceipt::schema::receipt_claim_t>,
                   groth16_receipt_t<zkreceipt::schema::receipt_claim_t>,
                   fake_receipt_t<zkreceipt::schema::receipt_claim_t>>;

  variant_t value;

  /// "Composite", "Succinct", "Groth16" or "Fake".
  std::string_view name() const;

  /// The claim this receipt attests to. Composite receipts derive it from
  /// their segments and may throw receipt_format_error.
  zkreceipt::schema::maybe_pruned<zkreceipt::schema::receipt_claim_t> claim()
      const;

  zkreceipt::schema::digest_t claim_digest(
      const zkreceipt::hash::hash_engine& engine) const;

  /// Zero for fake receipts.
  zkreceipt::schema::digest_t verifier_parameters() const;

  bool operator==(const inner_receipt_t&) const = default;
};

}  // namespace zkreceipt::receipt
