#include <zkreceipt/schema/merkle_proof.hpp>

namespace zkreceipt::schema {

digest_t merkle_proof<1>::root(
    const digest_t& leaf,
    const zkreceipt::hash::hash_engine& engine) const {
  auto node = leaf;
  auto position = index;
  for (const auto& sibling : digests) {
    if ((position & 1u) == 0) {
      node = engine.hash_pair(node, sibling);
    } else {
      node = engine.hash_pair(sibling, node);
    }
    position >>= 1u;
  }
  return node;
}

}  // namespace zkreceipt::schema
