#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/digest.hpp>

#include <cstdint>
#include <string_view>

namespace zkreceipt::schema {

template <uint16_t Version>
struct system_state;

/// Committed machine state at a point in execution.
template <>
struct system_state<1> final {
  static constexpr auto kTag = std::string_view{"risc0.SystemState"};

  /// The program counter.
  uint32_t pc{};
  /// Root of the Merkle tree over the memory image.
  digest_t merkle_root;

  digest_t digest(const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const system_state&) const = default;
};

using system_state_t = system_state<1>;

}  // namespace zkreceipt::schema
