#pragma once
#include <zkreceipt/schema/primitives.hpp>

#include <optional>
#include <string>

namespace zkreceipt::convert {

/// What an external verifier consumes: the flat seal and the journal.
struct proof_data final {
  zkreceipt::schema::bytes_t seal;
  zkreceipt::schema::bytes_t journal;

  bool operator==(const proof_data&) const = default;
};

/// Decode a bincode-serialized receipt and extract its seal and journal.
///
/// Throws decode_error for malformed input and unsupported_receipt_error when
/// the receipt is not a Groth16 receipt.
proof_data convert(const zkreceipt::schema::bytes_view_t& receipt_bytes);

/// As convert, but reports failure through `error` instead of throwing.
std::optional<proof_data> try_convert(
    const zkreceipt::schema::bytes_view_t& receipt_bytes, std::string& error);

}  // namespace zkreceipt::convert
