#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/exit_code.hpp>
#include <zkreceipt/schema/input.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>
#include <zkreceipt/schema/output.hpp>
#include <zkreceipt/schema/system_state.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace zkreceipt::schema {

template <uint16_t Version>
struct receipt_claim;

/// Execution went from `pre` to `post`, terminating with `exit_code`, given
/// `input` and producing `output`.
template <>
struct receipt_claim<1> final {
  static constexpr auto kTag = std::string_view{"risc0.ReceiptClaim"};

  maybe_pruned<system_state_t> pre;
  maybe_pruned<system_state_t> post;
  exit_code_t exit_code;
  maybe_pruned<std::optional<input_t>> input;
  maybe_pruned<std::optional<output_t>> output;

  /// Children are committed as (input, pre, post, output), followed by the
  /// exit code pair.
  digest_t digest(const zkreceipt::hash::hash_engine& engine) const;

  bool operator==(const receipt_claim&) const = default;
};

using receipt_claim_t = receipt_claim<1>;

}  // namespace zkreceipt::schema
