#pragma once
#include <zkreceipt/common/error.hpp>
#include <zkreceipt/encoding/bincode/codec.hpp>
#include <zkreceipt/encoding/bincode/stream.hpp>
#include <zkreceipt/encoding/encoder.hpp>

#include <spdlog/spdlog.h>

#include <optional>

namespace zkreceipt::encoding {

struct bincode_encoder_tag {};

/// Trailing input after a complete value is ignored.
template <>
struct encoder<bincode_encoder_tag> final {
  template <typename T>
  zkreceipt::schema::bytes_t encode(const T& obj) {
    auto out = zkreceipt::schema::bytes_t{};
    encode(obj, out);
    return out;
  }

  template <typename T>
  void encode(const T& obj, zkreceipt::schema::bytes_t& out) {
    auto w = bincode::writer{out};
    bincode::encode(obj, w);
  }

  template <typename T>
  T decode(const zkreceipt::schema::bytes_view_t& bytes) {
    auto r = bincode::reader{bytes};
    auto out = T{};
    bincode::decode(out, r);
    if (r.remaining() != 0) {
      spdlog::debug("bincode: ignoring {} trailing bytes", r.remaining());
    }
    return out;
  }

  template <typename T>
  std::optional<T> try_decode(const zkreceipt::schema::bytes_view_t& bytes) {
    try {
      return decode<T>(bytes);
    } catch (const zkreceipt::common::decode_error& e) {
      spdlog::debug("bincode: {}", e.what());
      return std::nullopt;
    }
  }
};

}  // namespace zkreceipt::encoding
