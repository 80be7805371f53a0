#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/digest.hpp>

#include <cstdint>
#include <iterator>
#include <span>
#include <string_view>

// Domain separated structural hashing.
//
//   tagged_struct(tag, down, data) =
//     H(H(tag) || down[0] || .. || down[n-1] || le32(data[0]) || .. ||
//       le16(n))
//
// Lists are cons-lists folded from the back, seeded with the zero digest.
// Tag strings and field order are part of the commitment format.
namespace zkreceipt::hash {

zkreceipt::schema::digest_t tagged_struct(
    const hash_engine& engine,
    std::string_view tag,
    std::span<const zkreceipt::schema::digest_t> down,
    std::span<const uint32_t> data);

zkreceipt::schema::digest_t tagged_struct(
    const hash_engine& engine,
    std::string_view tag,
    std::span<const zkreceipt::schema::digest_t> down);

zkreceipt::schema::digest_t tagged_list_cons(
    const hash_engine& engine,
    std::string_view tag,
    const zkreceipt::schema::digest_t& head,
    const zkreceipt::schema::digest_t& tail);

template <std::bidirectional_iterator Iterator>
zkreceipt::schema::digest_t tagged_iter(const hash_engine& engine,
                                        const std::string_view tag,
                                        Iterator first,
                                        Iterator last) {
  auto list_digest = zkreceipt::schema::digest_t::zero();
  while (last != first) {
    --last;
    list_digest = tagged_list_cons(engine, tag, *last, list_digest);
  }
  return list_digest;
}

zkreceipt::schema::digest_t tagged_list(
    const hash_engine& engine,
    std::string_view tag,
    std::span<const zkreceipt::schema::digest_t> list);

}  // namespace zkreceipt::hash
