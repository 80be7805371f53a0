#pragma once
#include <zkreceipt/schema/digestible.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>

#include <string_view>

namespace zkreceipt::receipt {

/// Carries a claim with no cryptographic material. Development only.
template <zkreceipt::schema::digestible Claim>
struct fake_receipt_t final {
  static constexpr auto kName = std::string_view{"Fake"};

  zkreceipt::schema::maybe_pruned<Claim> claim;

  bool operator==(const fake_receipt_t&) const = default;
};

}  // namespace zkreceipt::receipt
