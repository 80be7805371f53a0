#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/digest.hpp>

namespace zkreceipt::schema {

/// Claim whose shape is not yet specified.
///
/// Uninhabited: the only constructor is private and unused, so no value of
/// this type exists and code holding one is unreachable. Receipts over it can
/// only carry the pruned form of their claim.
class unknown_claim_t final {
 public:
  digest_t digest(const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const unknown_claim_t&) const = default;

 private:
  unknown_claim_t() = default;
};

/// Guest input. Uninhabited until its commitment is defined, so a claim can
/// only carry an absent or pruned input.
class input_t final {
 public:
  digest_t digest(const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const input_t&) const = default;

 private:
  input_t() = default;
};

}  // namespace zkreceipt::schema
