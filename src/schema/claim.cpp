#include <zkreceipt/common/critical.hpp>
#include <zkreceipt/hash/tagged.hpp>
#include <zkreceipt/schema/assumption.hpp>
#include <zkreceipt/schema/input.hpp>
#include <zkreceipt/schema/output.hpp>
#include <zkreceipt/schema/receipt_claim.hpp>
#include <zkreceipt/schema/system_state.hpp>

#include <algorithm>
#include <array>
#include <iterator>

namespace zkreceipt::schema {

digest_t system_state<1>::digest(
    const zkreceipt::hash::hash_engine& engine) const {
  return zkreceipt::hash::tagged_struct(engine, kTag, std::array{merkle_root},
                                        std::array{pc});
}

digest_t assumption<1>::digest(
    const zkreceipt::hash::hash_engine& engine) const {
  return zkreceipt::hash::tagged_struct(engine, kTag,
                                        std::array{claim, control_root});
}

digest_t assumptions<1>::digest(
    const zkreceipt::hash::hash_engine& engine) const {
  auto digests = digests_t{};
  digests.reserve(items.size());
  std::ranges::transform(items, std::back_inserter(digests),
                         [&](const auto& item) { return item.digest(engine); });
  return zkreceipt::hash::tagged_list(engine, kTag, digests);
}

digest_t unknown_claim_t::digest(const zkreceipt::hash::hash_engine&) const {
  zkreceipt::common::critical("unknown_claim_t has no values");
}

digest_t input_t::digest(const zkreceipt::hash::hash_engine&) const {
  zkreceipt::common::critical("input_t has no values");
}

digest_t output<1>::digest(const zkreceipt::hash::hash_engine& engine) const {
  return zkreceipt::hash::tagged_struct(
      engine, kTag,
      std::array{journal.digest(engine), assumptions.digest(engine)});
}

digest_t receipt_claim<1>::digest(
    const zkreceipt::hash::hash_engine& engine) const {
  auto [system_code, user_code] = exit_code.into_pair();
  return zkreceipt::hash::tagged_struct(
      engine, kTag,
      std::array{input.digest(engine), pre.digest(engine), post.digest(engine),
                 output.digest(engine)},
      std::array{system_code, user_code});
}

}  // namespace zkreceipt::schema
