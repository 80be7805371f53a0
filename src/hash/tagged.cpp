#include <zkreceipt/common/critical.hpp>
#include <zkreceipt/hash/tagged.hpp>

#include <boost/endian/conversion.hpp>

#include <array>
#include <iterator>
#include <limits>

namespace zkreceipt::hash {

namespace {

template <typename T>
void append_le(zkreceipt::schema::bytes_t& out, const T value) {
  auto le = boost::endian::native_to_little(value);
  auto* raw = reinterpret_cast<const uint8_t*>(&le);
  out.insert(std::end(out), raw, raw + sizeof(T));
}

}  // namespace

zkreceipt::schema::digest_t tagged_struct(
    const hash_engine& engine,
    const std::string_view tag,
    const std::span<const zkreceipt::schema::digest_t> down,
    const std::span<const uint32_t> data) {
  if (down.size() > std::numeric_limits<uint16_t>::max()) {
    zkreceipt::common::critical("struct {} defined with more than 2^16 fields",
                                tag);
  }

  auto tag_digest = engine.hash_bytes(zkreceipt::schema::make_bytes_view(tag));
  auto all = zkreceipt::schema::bytes_t{};
  all.reserve(zkreceipt::schema::kDigestBytes * (down.size() + 1) +
              sizeof(uint32_t) * data.size() + sizeof(uint16_t));
  auto tag_bytes = tag_digest.bytes();
  all.insert(std::end(all), std::begin(tag_bytes), std::end(tag_bytes));
  for (const auto& digest : down) {
    auto child = digest.bytes();
    all.insert(std::end(all), std::begin(child), std::end(child));
  }
  for (const auto word : data) {
    append_le(all, word);
  }
  append_le(all, static_cast<uint16_t>(down.size()));
  return engine.hash_bytes(all);
}

zkreceipt::schema::digest_t tagged_struct(
    const hash_engine& engine,
    const std::string_view tag,
    const std::span<const zkreceipt::schema::digest_t> down) {
  return tagged_struct(engine, tag, down, std::span<const uint32_t>{});
}

zkreceipt::schema::digest_t tagged_list_cons(
    const hash_engine& engine,
    const std::string_view tag,
    const zkreceipt::schema::digest_t& head,
    const zkreceipt::schema::digest_t& tail) {
  return tagged_struct(engine, tag, std::array{head, tail});
}

zkreceipt::schema::digest_t tagged_list(
    const hash_engine& engine,
    const std::string_view tag,
    const std::span<const zkreceipt::schema::digest_t> list) {
  return tagged_iter(engine, tag, std::begin(list), std::end(list));
}

}  // namespace zkreceipt::hash
