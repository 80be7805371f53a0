#include <zkreceipt/common/error.hpp>
#include <zkreceipt/convert/convert.hpp>
#include <zkreceipt/encoding/bincode/encoder.hpp>
#include <zkreceipt/receipt/receipt.hpp>
#include <zkreceipt/receipt/seal.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace zkreceipt::convert {

proof_data convert(const zkreceipt::schema::bytes_view_t& receipt_bytes) {
  auto enc = zkreceipt::encoding::encoder<
      zkreceipt::encoding::bincode_encoder_tag>{};
  auto receipt = enc.decode<zkreceipt::receipt::receipt_t>(receipt_bytes);

  auto out = proof_data{zkreceipt::receipt::encode_seal(receipt),
                        std::move(receipt.journal.bytes)};
  spdlog::debug("converted {} receipt: seal {} bytes, journal {} bytes",
                receipt.inner.name(), out.seal.size(), out.journal.size());
  return out;
}

std::optional<proof_data> try_convert(
    const zkreceipt::schema::bytes_view_t& receipt_bytes, std::string& error) {
  try {
    return convert(receipt_bytes);
  } catch (const zkreceipt::common::error& ex) {
    spdlog::warn("convert failed ({}): {}", to_string(ex.code()), ex.what());
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace zkreceipt::convert
