#include <zkreceipt/receipt/inner_receipt.hpp>

namespace zkreceipt::receipt {

using namespace zkreceipt::schema;

std::string_view inner_receipt_t::name() const {
  return std::visit([](const auto& inner) { return inner.kName; }, value);
}

maybe_pruned<receipt_claim_t> inner_receipt_t::claim() const {
  return std::visit(
      overloaded{[](const composite_receipt_t& inner) {
                   return maybe_pruned<receipt_claim_t>{inner.claim()};
                 },
                 [](const auto& inner) { return inner.claim; }},
      value);
}

digest_t inner_receipt_t::claim_digest(
    const zkreceipt::hash::hash_engine& engine) const {
  return claim().digest(engine);
}

digest_t inner_receipt_t::verifier_parameters() const {
  return std::visit(
      overloaded{
          [](const fake_receipt_t<receipt_claim_t>&) {
            return digest_t::zero();
          },
          [](const auto& inner) { return inner.verifier_parameters; }},
      value);
}

}  // namespace zkreceipt::receipt
