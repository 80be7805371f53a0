#include <zkreceipt/common/error.hpp>
#include <zkreceipt/receipt/seal.hpp>

#include <spdlog/spdlog.h>

#include <iterator>

namespace zkreceipt::receipt {

using namespace zkreceipt::schema;

namespace {

inline constexpr auto kSelectorBytes = std::size_t{4};

[[noreturn]] void unsupported(const std::string_view variant) {
  throw zkreceipt::common::unsupported_receipt_error{variant};
}

}  // namespace

bytes_t encode_seal(const receipt_t& receipt) {
  return std::visit(
      overloaded{
          [](const groth16_receipt_t<receipt_claim_t>& inner) {
            auto parameters = inner.verifier_parameters.bytes();
            auto seal = bytes_t{};
            seal.reserve(kSelectorBytes + inner.seal.size());
            seal.insert(std::end(seal), std::begin(parameters),
                        std::begin(parameters) + kSelectorBytes);
            seal.insert(std::end(seal), std::begin(inner.seal),
                        std::end(inner.seal));
            return seal;
          },
          [](const succinct_receipt_t<receipt_claim_t>& inner) -> bytes_t {
            unsupported(inner.kName);
          },
          [](const composite_receipt_t& inner) -> bytes_t {
            unsupported(inner.kName);
          },
          [](const fake_receipt_t<receipt_claim_t>& inner) -> bytes_t {
            unsupported(inner.kName);
          }},
      receipt.inner.value);
}

std::optional<bytes_t> try_encode_seal(const receipt_t& receipt) {
  try {
    return encode_seal(receipt);
  } catch (const zkreceipt::common::unsupported_receipt_error& ex) {
    spdlog::debug("{}", ex.what());
    return std::nullopt;
  }
}

}  // namespace zkreceipt::receipt
