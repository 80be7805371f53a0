#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/assumption.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>
#include <zkreceipt/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace zkreceipt::schema {

template <uint16_t Version>
struct output;

/// Externally visible result of an execution.
template <>
struct output<1> final {
  static constexpr auto kTag = std::string_view{"risc0.Output"};

  /// The journal committed to by the guest.
  maybe_pruned<bytes_t> journal;

  /// Claim digests the guest verified through composition. A non-empty list
  /// makes the claim conditional on a receipt for every entry.
  maybe_pruned<assumptions_t> assumptions;

  digest_t digest(const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const output&) const = default;
};

using output_t = output<1>;

}  // namespace zkreceipt::schema
