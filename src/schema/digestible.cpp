#include <zkreceipt/schema/digestible.hpp>

namespace zkreceipt::schema {

digest_t digest_of(const bytes_t& bytes,
                   const zkreceipt::hash::hash_engine& engine) {
  return engine.hash_bytes(bytes);
}

}  // namespace zkreceipt::schema
