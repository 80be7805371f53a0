#pragma once
#include <zkreceipt/common/error.hpp>
#include <zkreceipt/encoding/bincode/stream.hpp>
#include <zkreceipt/receipt/composite_receipt.hpp>
#include <zkreceipt/receipt/fake_receipt.hpp>
#include <zkreceipt/receipt/groth16_receipt.hpp>
#include <zkreceipt/receipt/inner_receipt.hpp>
#include <zkreceipt/receipt/receipt.hpp>
#include <zkreceipt/receipt/segment_receipt.hpp>
#include <zkreceipt/receipt/succinct_receipt.hpp>
#include <zkreceipt/schema/assumption.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/exit_code.hpp>
#include <zkreceipt/schema/input.hpp>
#include <zkreceipt/schema/maybe_pruned.hpp>
#include <zkreceipt/schema/merkle_proof.hpp>
#include <zkreceipt/schema/output.hpp>
#include <zkreceipt/schema/primitives.hpp>
#include <zkreceipt/schema/receipt_claim.hpp>
#include <zkreceipt/schema/system_state.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Legacy bincode layout: little-endian fixed-width integers, u64 lengths,
// u32 enum variant indices, u8 option tags, struct fields in declaration
// order.
//
// Every overload is declared before any template body so that the templates
// resolve element codecs by ordinary lookup.
namespace zkreceipt::encoding::bincode {

void encode(uint32_t o, writer& w);
void decode(uint32_t& o, reader& r);

void encode(const std::string& o, writer& w);
void decode(std::string& o, reader& r);

void encode(const zkreceipt::schema::bytes_t& o, writer& w);
void decode(zkreceipt::schema::bytes_t& o, reader& r);

void encode(const zkreceipt::schema::digest_t& o, writer& w);
void decode(zkreceipt::schema::digest_t& o, reader& r);

void encode(const zkreceipt::schema::exit_code_t& o, writer& w);
void decode(zkreceipt::schema::exit_code_t& o, reader& r);

void encode(const zkreceipt::schema::system_state_t& o, writer& w);
void decode(zkreceipt::schema::system_state_t& o, reader& r);

void encode(const zkreceipt::schema::assumption_t& o, writer& w);
void decode(zkreceipt::schema::assumption_t& o, reader& r);

void encode(const zkreceipt::schema::assumptions_t& o, writer& w);
void decode(zkreceipt::schema::assumptions_t& o, reader& r);

void encode(const zkreceipt::schema::output_t& o, writer& w);
void decode(zkreceipt::schema::output_t& o, reader& r);

void encode(const zkreceipt::schema::receipt_claim_t& o, writer& w);
void decode(zkreceipt::schema::receipt_claim_t& o, reader& r);

void encode(const zkreceipt::schema::merkle_proof_t& o, writer& w);
void decode(zkreceipt::schema::merkle_proof_t& o, reader& r);

// Uninhabited types: values never reach the encoder and the decoder rejects
// the value form.
void encode(const zkreceipt::schema::unknown_claim_t& o, writer& w);
void encode(const zkreceipt::schema::input_t& o, writer& w);
void decode(zkreceipt::schema::maybe_pruned<zkreceipt::schema::unknown_claim_t>& o,
            reader& r);
void decode(std::optional<zkreceipt::schema::input_t>& o, reader& r);

void encode(const zkreceipt::receipt::segment_receipt_t& o, writer& w);
void decode(zkreceipt::receipt::segment_receipt_t& o, reader& r);

void encode(const zkreceipt::receipt::composite_receipt_t& o, writer& w);
void decode(zkreceipt::receipt::composite_receipt_t& o, reader& r);

void encode(const zkreceipt::receipt::inner_assumption_receipt_t& o, writer& w);
void decode(zkreceipt::receipt::inner_assumption_receipt_t& o, reader& r);

void encode(const zkreceipt::receipt::inner_receipt_t& o, writer& w);
void decode(zkreceipt::receipt::inner_receipt_t& o, reader& r);

void encode(const zkreceipt::receipt::journal_t& o, writer& w);
void decode(zkreceipt::receipt::journal_t& o, reader& r);

void encode(const zkreceipt::receipt::receipt_metadata_t& o, writer& w);
void decode(zkreceipt::receipt::receipt_metadata_t& o, reader& r);

void encode(const zkreceipt::receipt::receipt_t& o, writer& w);
void decode(zkreceipt::receipt::receipt_t& o, reader& r);

template <typename T>
void encode(const std::vector<T>& o, writer& w);
template <typename T>
void decode(std::vector<T>& o, reader& r);

template <typename T>
void encode(const std::optional<T>& o, writer& w);
template <typename T>
void decode(std::optional<T>& o, reader& r);

template <typename T>
void encode(const zkreceipt::schema::maybe_pruned<T>& o, writer& w);
template <typename T>
void decode(zkreceipt::schema::maybe_pruned<T>& o, reader& r);

template <typename Claim>
void encode(const zkreceipt::receipt::succinct_receipt_t<Claim>& o, writer& w);
template <typename Claim>
void decode(zkreceipt::receipt::succinct_receipt_t<Claim>& o, reader& r);

template <typename Claim>
void encode(const zkreceipt::receipt::groth16_receipt_t<Claim>& o, writer& w);
template <typename Claim>
void decode(zkreceipt::receipt::groth16_receipt_t<Claim>& o, reader& r);

template <typename Claim>
void encode(const zkreceipt::receipt::fake_receipt_t<Claim>& o, writer& w);
template <typename Claim>
void decode(zkreceipt::receipt::fake_receipt_t<Claim>& o, reader& r);

inline constexpr uint8_t kOptionNone = 0;
inline constexpr uint8_t kOptionSome = 1;
inline constexpr uint32_t kMaybePrunedValue = 0;
inline constexpr uint32_t kMaybePrunedPruned = 1;

template <typename T>
void encode(const std::vector<T>& o, writer& w) {
  w.write_length(o.size());
  for (const auto& item : o) {
    encode(item, w);
  }
}

template <typename T>
void decode(std::vector<T>& o, reader& r) {
  // Every element of these types occupies at least one byte.
  auto length = r.read_length(1);
  o.clear();
  o.reserve(std::min(length, r.remaining()));
  for (std::size_t i = 0; i < length; ++i) {
    auto item = T{};
    decode(item, r);
    o.push_back(std::move(item));
  }
}

template <typename T>
void encode(const std::optional<T>& o, writer& w) {
  if (!o) {
    w.write_u8(kOptionNone);
    return;
  }
  w.write_u8(kOptionSome);
  encode(*o, w);
}

template <typename T>
void decode(std::optional<T>& o, reader& r) {
  auto tag = r.read_u8();
  if (tag == kOptionNone) {
    o.reset();
    return;
  }
  if (tag != kOptionSome) {
    throw zkreceipt::common::decode_error{
        fmt::format("invalid Option tag {}", tag)};
  }
  auto value = T{};
  decode(value, r);
  o = std::move(value);
}

template <typename T>
void encode(const zkreceipt::schema::maybe_pruned<T>& o, writer& w) {
  if (const auto* value = o.as_value()) {
    w.write_u32(kMaybePrunedValue);
    encode(*value, w);
    return;
  }
  w.write_u32(kMaybePrunedPruned);
  encode(*o.as_pruned(), w);
}

template <typename T>
void decode(zkreceipt::schema::maybe_pruned<T>& o, reader& r) {
  auto tag = r.read_u32();
  if (tag == kMaybePrunedValue) {
    auto value = T{};
    decode(value, r);
    o = zkreceipt::schema::maybe_pruned<T>{std::move(value)};
    return;
  }
  if (tag != kMaybePrunedPruned) {
    throw zkreceipt::common::decode_error{
        fmt::format("invalid MaybePruned variant index {}", tag)};
  }
  auto digest = zkreceipt::schema::digest_t{};
  decode(digest, r);
  o = zkreceipt::schema::maybe_pruned<T>::pruned(digest);
}

template <typename Claim>
void encode(const zkreceipt::receipt::succinct_receipt_t<Claim>& o,
            writer& w) {
  encode(o.seal, w);
  encode(o.control_id, w);
  encode(o.claim, w);
  encode(o.hashfn, w);
  encode(o.verifier_parameters, w);
  encode(o.control_inclusion_proof, w);
}

template <typename Claim>
void decode(zkreceipt::receipt::succinct_receipt_t<Claim>& o, reader& r) {
  decode(o.seal, r);
  decode(o.control_id, r);
  decode(o.claim, r);
  decode(o.hashfn, r);
  decode(o.verifier_parameters, r);
  decode(o.control_inclusion_proof, r);
}

template <typename Claim>
void encode(const zkreceipt::receipt::groth16_receipt_t<Claim>& o,
            writer& w) {
  encode(o.seal, w);
  encode(o.claim, w);
  encode(o.verifier_parameters, w);
}

template <typename Claim>
void decode(zkreceipt::receipt::groth16_receipt_t<Claim>& o, reader& r) {
  decode(o.seal, r);
  decode(o.claim, r);
  decode(o.verifier_parameters, r);
}

template <typename Claim>
void encode(const zkreceipt::receipt::fake_receipt_t<Claim>& o, writer& w) {
  encode(o.claim, w);
}

template <typename Claim>
void decode(zkreceipt::receipt::fake_receipt_t<Claim>& o, reader& r) {
  decode(o.claim, r);
}

}  // namespace zkreceipt::encoding::bincode
