#include <zkreceipt/common/error.hpp>
#include <zkreceipt/receipt/composite_receipt.hpp>

#include <optional>
#include <utility>

namespace zkreceipt::receipt {

using namespace zkreceipt::schema;

receipt_claim_t composite_receipt_t::claim() const {
  if (segments.empty()) {
    throw zkreceipt::common::receipt_format_error{
        "composite receipt has no segments"};
  }
  const auto& first = segments.front().claim;
  const auto& last = segments.back().claim;

  const auto* last_output = last.output.as_value();
  if (last_output == nullptr) {
    throw zkreceipt::common::receipt_format_error{
        "output of the final segment is pruned"};
  }

  auto resolved = std::optional<output_t>{};
  if (last_output->has_value()) {
    resolved = output_t{};
    resolved->journal = (*last_output)->journal;
    resolved->assumptions = maybe_pruned<assumptions_t>{assumptions_t{}};
  }

  auto derived = receipt_claim_t{};
  derived.pre = first.pre;
  derived.post = last.post;
  derived.exit_code = last.exit_code;
  derived.input = first.input;
  derived.output = maybe_pruned<std::optional<output_t>>{std::move(resolved)};
  return derived;
}

bool composite_receipt_t::operator==(const composite_receipt_t& other) const {
  return segments == other.segments &&
         assumption_receipts == other.assumption_receipts &&
         verifier_parameters == other.verifier_parameters;
}

std::string_view inner_assumption_receipt_t::name() const {
  return std::visit([](const auto& inner) { return inner.kName; }, value);
}

digest_t inner_assumption_receipt_t::claim_digest(
    const zkreceipt::hash::hash_engine& engine) const {
  return std::visit(
      overloaded{
          [&](const composite_receipt_t& inner) {
            return inner.claim().digest(engine);
          },
          [&](const auto& inner) { return inner.claim.digest(engine); }},
      value);
}

}  // namespace zkreceipt::receipt
