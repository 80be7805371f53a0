#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/digest.hpp>

#include <cstdint>

namespace zkreceipt::schema {

template <uint16_t Version>
struct merkle_proof;

/// Inclusion proof of a leaf (typically a control id) under a Merkle root.
template <>
struct merkle_proof<1> final {
  /// Index of the leaf whose inclusion is proven.
  uint32_t index{};

  /// Sibling digests from the leaf towards the root, root excluded.
  digests_t digests;

  /// Recompute the root for `leaf`. Bit i of the index places the running
  /// node on the left (0) or right (1) at level i. The caller compares the
  /// result against a trusted root.
  digest_t root(const digest_t& leaf,
                const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const merkle_proof&) const = default;
};

using merkle_proof_t = merkle_proof<1>;

}  // namespace zkreceipt::schema
