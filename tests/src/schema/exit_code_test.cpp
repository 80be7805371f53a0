#include <gtest/gtest.h>
#include <zkreceipt/common/error.hpp>
#include <zkreceipt/schema/exit_code.hpp>

#include <utility>
#include <vector>

using zkreceipt::schema::exit_code_t;

TEST(exit_code, pairs_round_trip) {
  auto codes = std::vector{exit_code_t::halted(0), exit_code_t::halted(255),
                           exit_code_t::paused(7), exit_code_t::system_split(),
                           exit_code_t::session_limit()};
  for (const auto& code : codes) {
    auto [system_code, user_code] = code.into_pair();
    EXPECT_EQ(exit_code_t::from_pair(system_code, user_code), code)
        << code.to_string();
  }
}

TEST(exit_code, into_pair_values) {
  EXPECT_EQ(exit_code_t::halted(3).into_pair(), std::make_pair(0u, 3u));
  EXPECT_EQ(exit_code_t::paused(4).into_pair(), std::make_pair(1u, 4u));
  EXPECT_EQ(exit_code_t::system_split().into_pair(), std::make_pair(2u, 0u));
  EXPECT_EQ(exit_code_t::session_limit().into_pair(), std::make_pair(2u, 2u));
}

TEST(exit_code, system_split_absorbs_other_user_codes) {
  EXPECT_EQ(exit_code_t::from_pair(2, 0), exit_code_t::system_split());
  EXPECT_EQ(exit_code_t::from_pair(2, 9), exit_code_t::system_split());
  EXPECT_EQ(exit_code_t::from_pair(2, 2), exit_code_t::session_limit());
}

TEST(exit_code, unknown_system_code_is_rejected) {
  try {
    static_cast<void>(exit_code_t::from_pair(3, 0));
    FAIL() << "expected invalid_exit_code_error";
  } catch (const zkreceipt::common::invalid_exit_code_error& ex) {
    EXPECT_EQ(ex.system_code(), 3u);
    EXPECT_EQ(ex.user_code(), 0u);
    EXPECT_EQ(ex.code(), zkreceipt::common::error_code::invalid_exit_code);
  }
  EXPECT_FALSE(exit_code_t::try_from_pair(3, 0).has_value());
}

TEST(exit_code, expects_output_only_for_guest_exits) {
  EXPECT_TRUE(exit_code_t::halted(1).expects_output());
  EXPECT_TRUE(exit_code_t::paused(0).expects_output());
  EXPECT_FALSE(exit_code_t::system_split().expects_output());
  EXPECT_FALSE(exit_code_t::session_limit().expects_output());
}

TEST(exit_code, is_ok_only_for_halted_zero) {
  EXPECT_TRUE(exit_code_t{}.is_ok());
  EXPECT_TRUE(exit_code_t::halted(0).is_ok());
  EXPECT_FALSE(exit_code_t::halted(1).is_ok());
  EXPECT_FALSE(exit_code_t::paused(0).is_ok());
}

TEST(exit_code, to_string_names_variant) {
  EXPECT_EQ(exit_code_t::halted(255).to_string(), "Halted(255)");
  EXPECT_EQ(exit_code_t::paused(7).to_string(), "Paused(7)");
  EXPECT_EQ(exit_code_t::system_split().to_string(), "SystemSplit");
  EXPECT_EQ(exit_code_t::session_limit().to_string(), "SessionLimit");
}
