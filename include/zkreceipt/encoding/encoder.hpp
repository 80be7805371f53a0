#pragma once
#include <zkreceipt/schema/primitives.hpp>

#include <optional>

namespace zkreceipt::encoding {

// Wire codecs are selected at build time by tag:
//   auto enc = encoder<bincode_encoder_tag>{};
//   auto receipt = enc.decode<zkreceipt::receipt::receipt_t>(bytes);
// decode throws decode_error on malformed input; try_decode returns nullopt.
template <typename Library>
struct encoder {
  template <typename T>
  zkreceipt::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, zkreceipt::schema::bytes_t& out);

  template <typename T>
  T decode(const zkreceipt::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const zkreceipt::schema::bytes_view_t& bytes);
};

}  // namespace zkreceipt::encoding
