#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zkreceipt::common {

enum class error_code : uint32_t {
  decode_failed = 1,
  invalid_exit_code = 2,
  unsupported_receipt = 3,
  unsupported_hash_function = 4,
  receipt_format = 5,
};

std::string_view to_string(error_code code);

/// Base of every input-driven failure raised by the library.
class error : public std::runtime_error {
 public:
  error(error_code code, const std::string& message);

  error_code code() const;

 private:
  error_code code_;
};

class decode_error final : public error {
 public:
  explicit decode_error(const std::string& message);
};

/// Raised by exit_code::from_pair when the system part is not 0, 1 or 2.
class invalid_exit_code_error final : public error {
 public:
  invalid_exit_code_error(uint32_t system_code, uint32_t user_code);

  uint32_t system_code() const;
  uint32_t user_code() const;

 private:
  uint32_t system_code_;
  uint32_t user_code_;
};

class unsupported_receipt_error final : public error {
 public:
  explicit unsupported_receipt_error(std::string_view variant);

  const std::string& variant() const;

 private:
  std::string variant_;
};

class unsupported_hash_function_error final : public error {
 public:
  explicit unsupported_hash_function_error(std::string_view name);

  const std::string& name() const;

 private:
  std::string name_;
};

class receipt_format_error final : public error {
 public:
  explicit receipt_format_error(const std::string& message);
};

}  // namespace zkreceipt::common
