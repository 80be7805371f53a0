#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace zkreceipt::schema {

template <uint16_t Version>
struct assumption;

/// A claim this execution depends on and the control root it must be
/// verified under.
template <>
struct assumption<1> final {
  static constexpr auto kTag = std::string_view{"risc0.Assumption"};

  digest_t claim;
  digest_t control_root;

  digest_t digest(const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const assumption&) const = default;
};

using assumption_t = assumption<1>;

template <uint16_t Version>
struct assumptions;

/// Ordered assumption list, committed as a tagged cons-list.
template <>
struct assumptions<1> final {
  static constexpr auto kTag = std::string_view{"risc0.Assumptions"};

  std::vector<maybe_pruned<assumption_t>> items;

  bool empty() const { return items.empty(); }

  digest_t digest(const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const assumptions&) const = default;
};

using assumptions_t = assumptions<1>;

}  // namespace zkreceipt::schema
