#include <zkreceipt/common/error.hpp>
#include <zkreceipt/encoding/bincode/codec.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <utility>
#include <variant>

namespace zkreceipt::encoding::bincode {

namespace {

// Shared by InnerReceipt and InnerAssumptionReceipt, whose alternatives line
// up index for index: Composite, Succinct, Groth16, Fake.
template <typename Variant>
void encode_variant(const Variant& o, writer& w) {
  w.write_u32(static_cast<uint32_t>(o.index()));
  std::visit([&w](const auto& alternative) { encode(alternative, w); }, o);
}

template <typename Variant, std::size_t Index = 0>
void decode_alternative(Variant& o, const uint32_t index, reader& r) {
  if constexpr (Index < std::variant_size_v<Variant>) {
    if (index == Index) {
      auto alternative = std::variant_alternative_t<Index, Variant>{};
      decode(alternative, r);
      o.template emplace<Index>(std::move(alternative));
      return;
    }
    decode_alternative<Variant, Index + 1>(o, index, r);
  } else {
    throw zkreceipt::common::decode_error{
        fmt::format("invalid receipt variant index {}", index)};
  }
}

template <typename Variant>
void decode_variant(Variant& o, reader& r) {
  auto index = r.read_u32();
  decode_alternative(o, index, r);
}

}  // namespace

void encode(const zkreceipt::receipt::segment_receipt_t& o, writer& w) {
  encode(o.seal, w);
  encode(o.index, w);
  encode(o.hashfn, w);
  encode(o.verifier_parameters, w);
  encode(o.claim, w);
}

void decode(zkreceipt::receipt::segment_receipt_t& o, reader& r) {
  decode(o.seal, r);
  decode(o.index, r);
  decode(o.hashfn, r);
  decode(o.verifier_parameters, r);
  decode(o.claim, r);
}

void encode(const zkreceipt::receipt::composite_receipt_t& o, writer& w) {
  encode(o.segments, w);
  encode(o.assumption_receipts, w);
  encode(o.verifier_parameters, w);
}

void decode(zkreceipt::receipt::composite_receipt_t& o, reader& r) {
  decode(o.segments, r);
  decode(o.assumption_receipts, r);
  decode(o.verifier_parameters, r);
}

void encode(const zkreceipt::receipt::inner_assumption_receipt_t& o,
            writer& w) {
  encode_variant(o.value, w);
}

void decode(zkreceipt::receipt::inner_assumption_receipt_t& o, reader& r) {
  auto guard = nesting_guard{r};
  decode_variant(o.value, r);
}

void encode(const zkreceipt::receipt::inner_receipt_t& o, writer& w) {
  encode_variant(o.value, w);
}

void decode(zkreceipt::receipt::inner_receipt_t& o, reader& r) {
  decode_variant(o.value, r);
}

void encode(const zkreceipt::receipt::journal_t& o, writer& w) {
  encode(o.bytes, w);
}

void decode(zkreceipt::receipt::journal_t& o, reader& r) {
  decode(o.bytes, r);
}

void encode(const zkreceipt::receipt::receipt_metadata_t& o, writer& w) {
  encode(o.verifier_parameters, w);
}

void decode(zkreceipt::receipt::receipt_metadata_t& o, reader& r) {
  decode(o.verifier_parameters, r);
}

void encode(const zkreceipt::receipt::receipt_t& o, writer& w) {
  encode(o.inner, w);
  encode(o.journal, w);
  encode(o.metadata, w);
}

void decode(zkreceipt::receipt::receipt_t& o, reader& r) {
  decode(o.inner, r);
  decode(o.journal, r);
  decode(o.metadata, r);
}

}  // namespace zkreceipt::encoding::bincode
