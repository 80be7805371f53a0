#include <zkreceipt/common/error.hpp>
#include <zkreceipt/encoding/bincode/stream.hpp>

#include <boost/endian/conversion.hpp>

#include <fmt/format.h>

#include <array>
#include <iterator>

namespace zkreceipt::encoding::bincode {

writer::writer(zkreceipt::schema::bytes_t& out) : out_{out} {}

void writer::write_u8(const uint8_t value) {
  out_.push_back(value);
}

void writer::write_u32(const uint32_t value) {
  auto raw = std::array<uint8_t, sizeof(uint32_t)>{};
  boost::endian::store_little_u32(raw.data(), value);
  out_.insert(std::end(out_), std::begin(raw), std::end(raw));
}

void writer::write_u64(const uint64_t value) {
  auto raw = std::array<uint8_t, sizeof(uint64_t)>{};
  boost::endian::store_little_u64(raw.data(), value);
  out_.insert(std::end(out_), std::begin(raw), std::end(raw));
}

void writer::write_bytes(const zkreceipt::schema::bytes_view_t& bytes) {
  out_.insert(std::end(out_), std::begin(bytes), std::end(bytes));
}

void writer::write_length(const std::size_t length) {
  write_u64(static_cast<uint64_t>(length));
}

reader::reader(const zkreceipt::schema::bytes_view_t& bytes) : bytes_{bytes} {}

uint8_t reader::read_u8() {
  return read_bytes(sizeof(uint8_t))[0];
}

uint32_t reader::read_u32() {
  return boost::endian::load_little_u32(read_bytes(sizeof(uint32_t)).data());
}

uint64_t reader::read_u64() {
  return boost::endian::load_little_u64(read_bytes(sizeof(uint64_t)).data());
}

zkreceipt::schema::bytes_view_t reader::read_bytes(const std::size_t size) {
  if (size > remaining()) {
    throw zkreceipt::common::decode_error{
        fmt::format("unexpected end of input: need {} byte(s) at offset {}, "
                    "{} remaining",
                    size, offset_, remaining())};
  }
  auto out = bytes_.subspan(offset_, size);
  offset_ += size;
  return out;
}

std::size_t reader::read_length(const std::size_t min_element_size) {
  auto length = read_u64();
  if (min_element_size != 0 && length > remaining() / min_element_size) {
    throw zkreceipt::common::decode_error{
        fmt::format("length prefix {} exceeds remaining input of {} byte(s)",
                    length, remaining())};
  }
  return static_cast<std::size_t>(length);
}

std::size_t reader::remaining() const {
  return bytes_.size() - offset_;
}

void reader::enter_nested() {
  if (depth_ >= kMaxNestingDepth) {
    throw zkreceipt::common::decode_error{fmt::format(
        "receipt nesting exceeds {} level(s) at offset {}", kMaxNestingDepth,
        offset_)};
  }
  ++depth_;
}

void reader::leave_nested() {
  --depth_;
}

nesting_guard::nesting_guard(reader& r) : reader_{r} {
  reader_.enter_nested();
}

nesting_guard::~nesting_guard() {
  reader_.leave_nested();
}

}  // namespace zkreceipt::encoding::bincode
