#include <zkreceipt/schema/digest.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>

namespace zkreceipt::schema {

digest_t digest_t::zero() {
  return digest_t{};
}

digest_t digest_t::from_bytes(const digest_bytes_t& bytes) {
  auto digest = digest_t{};
  std::memcpy(digest.words_.data(), bytes.data(), bytes.size());
  return digest;
}

std::optional<digest_t> digest_t::try_from_bytes(const bytes_view_t& bytes) {
  if (bytes.size() != kDigestBytes) {
    return std::nullopt;
  }
  auto raw = digest_bytes_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(raw));
  return from_bytes(raw);
}

digest_t digest_t::from_be_words(const digest_words_t& words) {
  auto digest = digest_t{};
  std::transform(std::begin(words), std::end(words),
                 std::begin(digest.words_), [](const uint32_t word) {
                   return boost::endian::native_to_big(word);
                 });
  return digest;
}

std::optional<digest_t> digest_t::try_from_hex(const std::string_view hex) {
  auto decoded = zkreceipt::schema::try_from_hex(hex);
  if (!decoded) {
    return std::nullopt;
  }
  return try_from_bytes(*decoded);
}

std::span<const uint8_t, kDigestBytes> digest_t::bytes() const {
  return std::span<const uint8_t, kDigestBytes>{
      reinterpret_cast<const uint8_t*>(words_.data()), kDigestBytes};
}

std::string digest_t::to_hex() const {
  return zkreceipt::schema::to_hex(bytes());
}

bool operator==(const digest_t& lhs, const digest_t& rhs) {
  return std::ranges::equal(lhs.bytes(), rhs.bytes());
}

std::strong_ordering operator<=>(const digest_t& lhs, const digest_t& rhs) {
  auto left = lhs.bytes();
  auto right = rhs.bytes();
  return std::lexicographical_compare_three_way(
      std::begin(left), std::end(left), std::begin(right), std::end(right));
}

}  // namespace zkreceipt::schema

std::size_t std::hash<zkreceipt::schema::digest_t>::operator()(
    const zkreceipt::schema::digest_t& digest) const {
  // Digest bytes are uniformly distributed.
  auto out = std::size_t{};
  std::memcpy(&out, digest.bytes().data(), sizeof(out));
  return out;
}
