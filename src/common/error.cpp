#include <zkreceipt/common/error.hpp>

#include <fmt/format.h>

namespace zkreceipt::common {

std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::decode_failed:
      return "decode failed";
    case error_code::invalid_exit_code:
      return "invalid exit code";
    case error_code::unsupported_receipt:
      return "unsupported receipt type";
    case error_code::unsupported_hash_function:
      return "unsupported hash function";
    case error_code::receipt_format:
      return "receipt format error";
  }
  return "unknown error";
}

error::error(const error_code code, const std::string& message)
    : std::runtime_error{message}, code_{code} {}

error_code error::code() const {
  return code_;
}

decode_error::decode_error(const std::string& message)
    : error{error_code::decode_failed,
            fmt::format("{}: {}", to_string(error_code::decode_failed),
                        message)} {}

invalid_exit_code_error::invalid_exit_code_error(const uint32_t system_code,
                                                 const uint32_t user_code)
    : error{error_code::invalid_exit_code,
            fmt::format("{}: ({}, {})", to_string(error_code::invalid_exit_code),
                        system_code, user_code)},
      system_code_{system_code},
      user_code_{user_code} {}

uint32_t invalid_exit_code_error::system_code() const {
  return system_code_;
}

uint32_t invalid_exit_code_error::user_code() const {
  return user_code_;
}

unsupported_receipt_error::unsupported_receipt_error(
    const std::string_view variant)
    : error{error_code::unsupported_receipt,
            fmt::format("Unsupported receipt type: {}", variant)},
      variant_{variant} {}

const std::string& unsupported_receipt_error::variant() const {
  return variant_;
}

unsupported_hash_function_error::unsupported_hash_function_error(
    const std::string_view name)
    : error{error_code::unsupported_hash_function,
            fmt::format("unsupported hash function: {}", name)},
      name_{name} {}

const std::string& unsupported_hash_function_error::name() const {
  return name_;
}

receipt_format_error::receipt_format_error(const std::string& message)
    : error{error_code::receipt_format,
            fmt::format("{}: {}", to_string(error_code::receipt_format),
                        message)} {}

}  // namespace zkreceipt::common
