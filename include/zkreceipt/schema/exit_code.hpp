#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace zkreceipt::schema {

/// How a guest execution terminated.
///
/// Externally represented as a (system, user) pair:
///   halted(u) -> (0, u), paused(u) -> (1, u),
///   system_split -> (2, 0), session_limit -> (2, 2).
class exit_code_t final {
 public:
  enum class kind : uint32_t {
    halted = 0,
    paused = 1,
    system_split = 2,
    session_limit = 3,
  };

  /// halted(0)
  exit_code_t() = default;

  static exit_code_t halted(uint32_t user_code);
  static exit_code_t paused(uint32_t user_code);
  static exit_code_t system_split();
  static exit_code_t session_limit();

  /// Throws invalid_exit_code_error when `system_code` is not 0, 1 or 2.
  static exit_code_t from_pair(uint32_t system_code, uint32_t user_code);
  static std::optional<exit_code_t> try_from_pair(uint32_t system_code,
                                                  uint32_t user_code);

  std::pair<uint32_t, uint32_t> into_pair() const;

  kind get_kind() const { return kind_; }

  /// Zero for system_split and session_limit.
  uint32_t user_code() const { return user_code_; }

  /// Only guest-initiated exits carry output.
  bool expects_output() const;

  /// True only for halted(0).
  bool is_ok() const;

  std::string to_string() const;

  bool operator==(const exit_code_t&) const = default;

 private:
  exit_code_t(kind value, uint32_t user_code);

  kind kind_{kind::halted};
  uint32_t user_code_{};
};

}  // namespace zkreceipt::schema
