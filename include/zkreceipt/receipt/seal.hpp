#pragma once
#include <zkreceipt/receipt/receipt.hpp>
#include <zkreceipt/schema/primitives.hpp>

#include <optional>

namespace zkreceipt::receipt {

/// Flat seal for external (on-chain style) verification.
///
/// Groth16: the first four bytes of the verifier parameters digest followed
/// by the raw SNARK seal. Every other strategy throws
/// unsupported_receipt_error naming the variant.
zkreceipt::schema::bytes_t encode_seal(const receipt_t& receipt);

std::optional<zkreceipt::schema::bytes_t> try_encode_seal(
    const receipt_t& receipt);

}  // namespace zkreceipt::receipt
