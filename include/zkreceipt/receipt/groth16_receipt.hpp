#pragma once
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/digestible.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>
#include <zkreceipt/schema/primitives.hpp>

#include <string_view>

namespace zkreceipt::receipt {

/// A claim proven with a single Groth16 SNARK.
template <zkreceipt::schema::digestible Claim>
struct groth16_receipt_t final {
  static constexpr auto kName = std::string_view{"Groth16"};

  /// Raw SNARK proof bytes.
  zkreceipt::schema::bytes_t seal;

  zkreceipt::schema::maybe_pruned<Claim> claim;

  /// Its leading four bytes select the on-chain verifier.
  zkreceipt::schema::digest_t verifier_parameters;

  bool operator==(const groth16_receipt_t&) const = default;
};

}  // namespace zkreceipt::receipt
