#pragma once
#include <zkreceipt/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

namespace zkreceipt::encoding::bincode {

/// Appends little-endian fixed-width values.
class writer final {
 public:
  explicit writer(zkreceipt::schema::bytes_t& out);

  void write_u8(uint8_t value);
  void write_u32(uint32_t value);
  void write_u64(uint64_t value);
  void write_bytes(const zkreceipt::schema::bytes_view_t& bytes);

  /// Sequence and string lengths are u64.
  void write_length(std::size_t length);

 private:
  zkreceipt::schema::bytes_t& out_;
};

/// Deepest chain of receipts nested through composite assumption receipts.
inline constexpr std::size_t kMaxNestingDepth = 64;

/// Bounds-checked cursor; every read past the end throws decode_error.
class reader final {
 public:
  explicit reader(const zkreceipt::schema::bytes_view_t& bytes);

  uint8_t read_u8();
  uint32_t read_u32();
  uint64_t read_u64();
  zkreceipt::schema::bytes_view_t read_bytes(std::size_t size);

  /// Reads a u64 length prefix and rejects lengths whose elements of
  /// `min_element_size` bytes each could not fit in the remaining input.
  std::size_t read_length(std::size_t min_element_size);

  std::size_t remaining() const;

  /// Throws decode_error once the depth would exceed kMaxNestingDepth.
  void enter_nested();
  void leave_nested();

 private:
  zkreceipt::schema::bytes_view_t bytes_;
  std::size_t offset_{};
  std::size_t depth_{};
};

/// Holds one level of nesting on a reader for the guard's lifetime.
class nesting_guard final {
 public:
  explicit nesting_guard(reader& r);
  ~nesting_guard();
  nesting_guard(const nesting_guard&) = delete;
  nesting_guard& operator=(const nesting_guard&) = delete;

 private:
  reader& reader_;
};

}  // namespace zkreceipt::encoding::bincode
