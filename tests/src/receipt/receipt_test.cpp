#include <gtest/gtest.h>
#include <zkreceipt/common/error.hpp>
#include <zkreceipt/hash/hash_suite.hpp>
#include <zkreceipt/receipt/receipt.hpp>
#include <zkreceipt/testing/common.hpp>

#include <optional>
#include <utility>

namespace {

using zkreceipt::receipt::composite_receipt_t;
using zkreceipt::receipt::fake_receipt_t;
using zkreceipt::receipt::groth16_receipt_t;
using zkreceipt::receipt::inner_assumption_receipt_t;
using zkreceipt::receipt::inner_receipt_t;
using zkreceipt::receipt::segment_receipt_t;
using zkreceipt::receipt::succinct_receipt_t;
using zkreceipt::schema::receipt_claim_t;
using zkreceipt::testing::digest_from_hex;
using zkreceipt::testing::make_digest;

const zkreceipt::hash::hash_engine& engine() {
  return zkreceipt::hash::default_hash_engine();
}

segment_receipt_t make_segment(const uint32_t index,
                               const receipt_claim_t& claim) {
  return segment_receipt_t{.seal = {0x04030201},
                           .index = index,
                           .hashfn = "sha-256",
                           .verifier_parameters = make_digest(96),
                           .claim = claim};
}

// Two segments: the first splits, the last halts with a conditional output.
composite_receipt_t make_composite() {
  auto first = zkreceipt::testing::make_claim();
  first.post = zkreceipt::testing::make_state(0x1800, make_digest(16));
  first.exit_code = zkreceipt::schema::exit_code_t::system_split();
  first.output = std::optional<zkreceipt::schema::output_t>{};

  auto last = zkreceipt::testing::make_claim();
  last.pre = zkreceipt::testing::make_state(0x1800, make_digest(16));
  auto output =
      zkreceipt::testing::make_output(zkreceipt::schema::bytes_t{0x10, 0x20});
  output.assumptions = zkreceipt::schema::assumptions_t{
      .items = {zkreceipt::schema::assumption_t{
          .claim = make_digest(1), .control_root = make_digest(2)}}};
  last.output = std::optional<zkreceipt::schema::output_t>{output};

  auto composite = composite_receipt_t{};
  composite.segments = {make_segment(0, first), make_segment(1, last)};
  composite.verifier_parameters = make_digest(96);
  return composite;
}

}  // namespace

TEST(composite_receipt, claim_spans_all_segments) {
  auto composite = make_composite();
  auto claim = composite.claim();
  EXPECT_EQ(claim.pre, composite.segments.front().claim.pre);
  EXPECT_EQ(claim.post, composite.segments.back().claim.post);
  EXPECT_EQ(claim.exit_code, zkreceipt::schema::exit_code_t::halted(0));

  // Assumptions are resolved by the receipts carried alongside, so the
  // unconditional claim matches a single segment run end to end.
  EXPECT_EQ(claim.digest(engine()),
            digest_from_hex("a1c93b5f3bb34f35a87643a259c36d9b"
                            "873a2953dfb7f632639416c66acd8042"));
}

TEST(composite_receipt, claim_requires_segments) {
  EXPECT_THROW(static_cast<void>(composite_receipt_t{}.claim()),
               zkreceipt::common::receipt_format_error);
}

TEST(composite_receipt, claim_requires_unpruned_final_output) {
  auto composite = make_composite();
  auto& last = composite.segments.back().claim;
  last.output = last.output.prune(engine());
  EXPECT_THROW(static_cast<void>(composite.claim()),
               zkreceipt::common::receipt_format_error);
}

TEST(composite_receipt, absent_final_output_stays_absent) {
  auto composite = make_composite();
  composite.segments.back().claim.output =
      std::optional<zkreceipt::schema::output_t>{};
  auto claim = composite.claim();
  ASSERT_NE(claim.output.as_value(), nullptr);
  EXPECT_FALSE(claim.output.as_value()->has_value());
}

TEST(inner_receipt, claim_and_parameters_per_strategy) {
  auto claim = zkreceipt::testing::make_claim();
  auto expected = claim.digest(engine());

  auto fake = inner_receipt_t{.value = fake_receipt_t<receipt_claim_t>{
                                  .claim = claim}};
  EXPECT_EQ(fake.name(), "Fake");
  EXPECT_EQ(fake.claim_digest(engine()), expected);
  EXPECT_EQ(fake.verifier_parameters(), zkreceipt::schema::digest_t::zero());

  auto groth16 = inner_receipt_t{
      .value = groth16_receipt_t<receipt_claim_t>{
          .seal = {},
          .claim = zkreceipt::schema::maybe_pruned<receipt_claim_t>::pruned(
              expected),
          .verifier_parameters = make_digest(96)}};
  EXPECT_EQ(groth16.name(), "Groth16");
  EXPECT_EQ(groth16.claim_digest(engine()), expected);
  EXPECT_EQ(groth16.verifier_parameters(), make_digest(96));

  auto composite = inner_receipt_t{.value = make_composite()};
  EXPECT_EQ(composite.name(), "Composite");
  EXPECT_EQ(composite.claim_digest(engine()), expected);
  EXPECT_TRUE(composite.claim().is_value());
}

TEST(inner_assumption_receipt, claim_digest_of_pruned_unknown_claim) {
  auto assumed = inner_assumption_receipt_t{
      .value = succinct_receipt_t<zkreceipt::schema::unknown_claim_t>{
          .seal = {},
          .control_id = make_digest(0),
          .claim = zkreceipt::schema::maybe_pruned<
              zkreceipt::schema::unknown_claim_t>::pruned(make_digest(1)),
          .hashfn = "sha-256",
          .verifier_parameters = {},
          .control_inclusion_proof = {}}};
  EXPECT_EQ(assumed.name(), "Succinct");
  EXPECT_EQ(assumed.claim_digest(engine()), make_digest(1));
}

TEST(succinct_receipt, control_root_recomputed_from_proof) {
  auto receipt = succinct_receipt_t<receipt_claim_t>{
      .seal = {0x04030201, 0x08070605},
      .control_id = make_digest(0),
      .claim = zkreceipt::testing::make_claim(),
      .hashfn = "sha-256",
      .verifier_parameters = {},
      .control_inclusion_proof = {.index = 2,
                                  .digests = {make_digest(32),
                                              make_digest(64)}}};
  EXPECT_EQ(receipt.control_root(),
            digest_from_hex("2b37b75e7cf5f65b0dd2d0785d8d088f"
                            "e8ebf06e8d9288e1a227f2fa1089a172"));
  EXPECT_EQ(receipt.seal_size(), 8u);
  EXPECT_EQ(receipt.seal_bytes(),
            (zkreceipt::schema::bytes_t{1, 2, 3, 4, 5, 6, 7, 8}));

  receipt.hashfn = "poseidon2";
  EXPECT_THROW(static_cast<void>(receipt.control_root()),
               zkreceipt::common::unsupported_hash_function_error);
}

TEST(segment_receipt, seal_is_little_endian_words) {
  auto segment = make_segment(3, zkreceipt::testing::make_claim());
  EXPECT_EQ(segment.seal_size(), 4u);
  EXPECT_EQ(segment.seal_bytes(), (zkreceipt::schema::bytes_t{1, 2, 3, 4}));
}
