#pragma once

#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/exit_code.hpp>
#include <zkreceipt/schema/input.hpp>
#include <zkreceipt/schema/output.hpp>
#include <zkreceipt/schema/primitives.hpp>
#include <zkreceipt/schema/receipt_claim.hpp>
#include <zkreceipt/schema/system_state.hpp>

#include <boost/endian/conversion.hpp>

#include <array>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zkreceipt::testing {

/// Digest whose bytes are seed, seed + 1, ..., seed + 31.
inline zkreceipt::schema::digest_t make_digest(const uint8_t seed) {
  auto bytes = zkreceipt::schema::digest_bytes_t{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return zkreceipt::schema::digest_t::from_bytes(bytes);
}

inline zkreceipt::schema::digest_t digest_from_hex(const std::string_view hex) {
  auto digest = zkreceipt::schema::digest_t::try_from_hex(hex);
  if (!digest) {
    throw std::invalid_argument{"bad digest hex in test vector"};
  }
  return *digest;
}

inline zkreceipt::schema::bytes_t bytes_from_hex(const std::string_view hex) {
  auto bytes = zkreceipt::schema::try_from_hex(hex);
  if (!bytes) {
    throw std::invalid_argument{"bad hex in test vector"};
  }
  return *bytes;
}

inline zkreceipt::schema::system_state_t make_state(
    const uint32_t pc,
    const zkreceipt::schema::digest_t& merkle_root) {
  return zkreceipt::schema::system_state_t{.pc = pc,
                                           .merkle_root = merkle_root};
}

/// Output committing to `journal` with an empty assumption list.
inline zkreceipt::schema::output_t make_output(
    const zkreceipt::schema::bytes_t& journal) {
  return zkreceipt::schema::output_t{
      .journal = journal, .assumptions = zkreceipt::schema::assumptions_t{}};
}

/// pre = (0x1000, make_digest(0)), post = (0x2000, make_digest(32)),
/// halted(0), no input, journal {0x10, 0x20}.
inline zkreceipt::schema::receipt_claim_t make_claim() {
  return zkreceipt::schema::receipt_claim_t{
      .pre = make_state(0x1000, make_digest(0)),
      .post = make_state(0x2000, make_digest(32)),
      .exit_code = zkreceipt::schema::exit_code_t::halted(0),
      .input = std::optional<zkreceipt::schema::input_t>{},
      .output = std::optional<zkreceipt::schema::output_t>{
          make_output(zkreceipt::schema::bytes_t{0x10, 0x20})}};
}

/// Verifier parameters whose first four bytes are AA BB CC DD.
inline zkreceipt::schema::digest_t make_verifier_parameters() {
  auto bytes = zkreceipt::schema::digest_bytes_t{};
  bytes[0] = 0xAA;
  bytes[1] = 0xBB;
  bytes[2] = 0xCC;
  bytes[3] = 0xDD;
  return zkreceipt::schema::digest_t::from_bytes(bytes);
}

/// Hand assembly of bincode literals, independent of the library encoder.
class wire_builder final {
 public:
  wire_builder& u8(const uint8_t value) {
    bytes_.push_back(value);
    return *this;
  }

  wire_builder& u32(const uint32_t value) {
    auto raw = std::array<uint8_t, 4>{};
    boost::endian::store_little_u32(raw.data(), value);
    bytes_.insert(std::end(bytes_), std::begin(raw), std::end(raw));
    return *this;
  }

  wire_builder& u64(const uint64_t value) {
    auto raw = std::array<uint8_t, 8>{};
    boost::endian::store_little_u64(raw.data(), value);
    bytes_.insert(std::end(bytes_), std::begin(raw), std::end(raw));
    return *this;
  }

  wire_builder& digest(const zkreceipt::schema::digest_t& value) {
    for (const auto word : value.words()) {
      u32(word);
    }
    return *this;
  }

  /// u64 length prefix followed by the raw bytes.
  wire_builder& sequence(const zkreceipt::schema::bytes_t& value) {
    u64(value.size());
    bytes_.insert(std::end(bytes_), std::begin(value), std::end(value));
    return *this;
  }

  wire_builder& text(const std::string_view value) {
    return sequence(zkreceipt::schema::make_bytes(value));
  }

  const zkreceipt::schema::bytes_t& bytes() const { return bytes_; }

 private:
  zkreceipt::schema::bytes_t bytes_;
};

}  // namespace zkreceipt::testing
