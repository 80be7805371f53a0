#pragma once
#include <zkreceipt/hash/hash_suite.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/digestible.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>
#include <zkreceipt/schema/merkle_proof.hpp>
#include <zkreceipt/schema/primitives.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace zkreceipt::receipt {

/// A claim proven with a single recursion STARK.
template <zkreceipt::schema::digestible Claim>
struct succinct_receipt_t final {
  static constexpr auto kName = std::string_view{"Succinct"};

  zkreceipt::schema::words_t seal;

  /// Identifier of the recursion program that produced the seal.
  zkreceipt::schema::digest_t control_id;

  zkreceipt::schema::maybe_pruned<Claim> claim;

  std::string hashfn;

  zkreceipt::schema::digest_t verifier_parameters;

  /// Proves `control_id` is a leaf under the control root.
  zkreceipt::schema::merkle_proof_t control_inclusion_proof;

  zkreceipt::schema::bytes_t seal_bytes() const {
    return zkreceipt::schema::make_le_bytes(seal);
  }

  std::size_t seal_size() const {
    return seal.size() * zkreceipt::schema::kWordSize;
  }

  /// Root recomputed from the inclusion proof under the `hashfn` suite.
  /// Throws unsupported_hash_function_error for an unregistered suite.
  zkreceipt::schema::digest_t control_root() const {
    const auto& engine = zkreceipt::hash::hash_engine_from_name(hashfn);
    return control_inclusion_proof.root(control_id, engine);
  }

  bool operator==(const succinct_receipt_t&) const = default;
};

}  // namespace zkreceipt::receipt
