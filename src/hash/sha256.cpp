#include <zkreceipt/common/critical.hpp>
#include <zkreceipt/hash/sha256.hpp>

#include <boost/endian/conversion.hpp>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <iterator>

// The block transform is the only OpenSSL entry point that accepts an
// explicit chaining state; it is deprecated but still exported in 3.x.
#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace zkreceipt::hash {

namespace {

using zkreceipt::schema::digest_t;
using zkreceipt::schema::kBlockBytes;
using zkreceipt::schema::kDigestBytes;

using block_bytes_t = std::array<uint8_t, kBlockBytes>;

/// Chaining state as OpenSSL expects it: host-order words.
SHA256_CTX make_context(const digest_t& state) {
  auto ctx = SHA256_CTX{};
  if (SHA256_Init(&ctx) != 1) {
    zkreceipt::common::critical("SHA256_Init failed");
  }
  for (std::size_t i = 0; i < state.words().size(); ++i) {
    ctx.h[i] = boost::endian::big_to_native(state.words()[i]);
  }
  return ctx;
}

digest_t read_state(const SHA256_CTX& ctx) {
  auto out = digest_t{};
  for (std::size_t i = 0; i < out.words().size(); ++i) {
    out.words()[i] =
        boost::endian::native_to_big(static_cast<uint32_t>(ctx.h[i]));
  }
  return out;
}

}  // namespace

std::string_view sha256_engine::name() const {
  return kName;
}

digest_t sha256_engine::hash_bytes(
    const zkreceipt::schema::bytes_view_t& bytes) const {
  auto raw = zkreceipt::schema::digest_bytes_t{};
  auto size = static_cast<unsigned int>(raw.size());
  if (EVP_Digest(bytes.data(), bytes.size(), raw.data(), &size, EVP_sha256(),
                 nullptr) != 1 ||
      size != kDigestBytes) {
    zkreceipt::common::critical("EVP_Digest(sha256) failed");
  }
  return digest_t::from_bytes(raw);
}

digest_t sha256_engine::compress(const digest_t& state,
                                 const digest_t& block_half1,
                                 const digest_t& block_half2) const {
  auto block = block_bytes_t{};
  std::ranges::copy(block_half1.bytes(), std::begin(block));
  std::ranges::copy(block_half2.bytes(), std::begin(block) + kDigestBytes);
  auto ctx = make_context(state);
  SHA256_Transform(&ctx, block.data());
  return read_state(ctx);
}

digest_t sha256_engine::compress_slice(
    const digest_t& state,
    const std::span<const block_t>& blocks) const {
  auto ctx = make_context(state);
  for (const auto& block : blocks) {
    SHA256_Transform(&ctx, reinterpret_cast<const uint8_t*>(block.data()));
  }
  return read_state(ctx);
}

digest_t sha256_engine::hash_raw_data_slice(
    const zkreceipt::schema::bytes_view_t& data) const {
  auto ctx = make_context(sha256_init());
  auto offset = std::size_t{0};
  while (offset + kBlockBytes <= data.size()) {
    SHA256_Transform(&ctx, data.data() + offset);
    offset += kBlockBytes;
  }
  if (offset < data.size()) {
    auto tail = block_bytes_t{};
    std::memcpy(tail.data(), data.data() + offset, data.size() - offset);
    SHA256_Transform(&ctx, tail.data());
  }
  return read_state(ctx);
}

}  // namespace zkreceipt::hash

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
