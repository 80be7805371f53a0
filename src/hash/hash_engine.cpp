#include <zkreceipt/hash/hash_engine.hpp>

namespace zkreceipt::hash {

zkreceipt::schema::digest_t sha256_init() {
  static const auto init = zkreceipt::schema::digest_t::from_be_words({
      0x6a09e667,
      0xbb67ae85,
      0x3c6ef372,
      0xa54ff53a,
      0x510e527f,
      0x9b05688c,
      0x1f83d9ab,
      0x5be0cd19,
  });
  return init;
}

zkreceipt::schema::digest_t hash_engine::hash_words(
    const zkreceipt::schema::words_view_t& words) const {
  return hash_bytes(zkreceipt::schema::make_bytes_view(words));
}

zkreceipt::schema::digest_t hash_engine::hash_pair(
    const zkreceipt::schema::digest_t& a,
    const zkreceipt::schema::digest_t& b) const {
  return compress(sha256_init(), a, b);
}

}  // namespace zkreceipt::hash
