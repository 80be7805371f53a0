#pragma once
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/primitives.hpp>

#include <concepts>
#include <iterator>
#include <optional>
#include <vector>

namespace zkreceipt::schema {

/// Raw byte content hashes directly with no tag. This is the only untagged
/// leaf digest.
digest_t digest_of(const bytes_t& bytes,
                   const zkreceipt::hash::hash_engine& engine);

template <typename T>
concept has_digest =
    requires(const T& value, const zkreceipt::hash::hash_engine& engine) {
      { value.digest(engine) } -> std::same_as<digest_t>;
    };

/// Committed records expose `digest(engine)`.
template <has_digest T>
digest_t digest_of(const T& value, const zkreceipt::hash::hash_engine& engine);

/// Absent values digest to the zero digest.
template <typename T>
digest_t digest_of(const std::optional<T>& value,
                   const zkreceipt::hash::hash_engine& engine);

/// Incremental untagged fold from the back:
///   acc = H(acc || digest(item)), seeded with the zero digest.
///
/// Not domain separated and open to front-extension: given the digest of a
/// list anyone can compute the digest of that list with elements prepended.
/// The empty list digests to zero. Kept bit-for-bit for compatibility.
template <typename T>
digest_t digest_of(const std::vector<T>& items,
                   const zkreceipt::hash::hash_engine& engine);

template <typename T>
concept digestible =
    requires(const T& value, const zkreceipt::hash::hash_engine& engine) {
      { digest_of(value, engine) } -> std::same_as<digest_t>;
    };

template <has_digest T>
digest_t digest_of(const T& value, const zkreceipt::hash::hash_engine& engine) {
  return value.digest(engine);
}

template <typename T>
digest_t digest_of(const std::optional<T>& value,
                   const zkreceipt::hash::hash_engine& engine) {
  if (!value) {
    return digest_t::zero();
  }
  return digest_of(*value, engine);
}

template <typename T>
digest_t digest_of(const std::vector<T>& items,
                   const zkreceipt::hash::hash_engine& engine) {
  auto accum = digest_t::zero();
  for (auto it = std::rbegin(items); it != std::rend(items); ++it) {
    auto item = digest_of(*it, engine);
    auto material = bytes_t{};
    material.reserve(kDigestBytes * 2);
    auto accum_bytes = accum.bytes();
    auto item_bytes = item.bytes();
    material.insert(std::end(material), std::begin(accum_bytes),
                    std::end(accum_bytes));
    material.insert(std::end(material), std::begin(item_bytes),
                    std::end(item_bytes));
    accum = engine.hash_bytes(material);
  }
  return accum;
}

}  // namespace zkreceipt::schema
