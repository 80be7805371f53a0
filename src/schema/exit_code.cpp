#include <zkreceipt/common/error.hpp>
#include <zkreceipt/schema/exit_code.hpp>

#include <fmt/format.h>

namespace zkreceipt::schema {

exit_code_t::exit_code_t(const kind value, const uint32_t user_code)
    : kind_{value}, user_code_{user_code} {}

exit_code_t exit_code_t::halted(const uint32_t user_code) {
  return exit_code_t{kind::halted, user_code};
}

exit_code_t exit_code_t::paused(const uint32_t user_code) {
  return exit_code_t{kind::paused, user_code};
}

exit_code_t exit_code_t::system_split() {
  return exit_code_t{kind::system_split, 0};
}

exit_code_t exit_code_t::session_limit() {
  return exit_code_t{kind::session_limit, 0};
}

std::optional<exit_code_t> exit_code_t::try_from_pair(
    const uint32_t system_code,
    const uint32_t user_code) {
  switch (system_code) {
    case 0:
      return halted(user_code);
    case 1:
      return paused(user_code);
    case 2:
      // (2, 2) is the only pair produced by session_limit.
      if (user_code == 2) {
        return session_limit();
      }
      return system_split();
    default:
      return std::nullopt;
  }
}

exit_code_t exit_code_t::from_pair(const uint32_t system_code,
                                   const uint32_t user_code) {
  auto decoded = try_from_pair(system_code, user_code);
  if (!decoded) {
    throw zkreceipt::common::invalid_exit_code_error{system_code, user_code};
  }
  return *decoded;
}

std::pair<uint32_t, uint32_t> exit_code_t::into_pair() const {
  switch (kind_) {
    case kind::halted:
      return {0, user_code_};
    case kind::paused:
      return {1, user_code_};
    case kind::system_split:
      return {2, 0};
    case kind::session_limit:
      return {2, 2};
  }
  return {0, user_code_};
}

bool exit_code_t::expects_output() const {
  return kind_ == kind::halted || kind_ == kind::paused;
}

bool exit_code_t::is_ok() const {
  return kind_ == kind::halted && user_code_ == 0;
}

std::string exit_code_t::to_string() const {
  switch (kind_) {
    case kind::halted:
      return fmt::format("Halted({})", user_code_);
    case kind::paused:
      return fmt::format("Paused({})", user_code_);
    case kind::system_split:
      return "SystemSplit";
    case kind::session_limit:
      return "SessionLimit";
  }
  return "Unknown";
}

}  // namespace zkreceipt::schema
