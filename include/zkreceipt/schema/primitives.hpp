#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zkreceipt::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using words_t = std::vector<uint32_t>;
using words_view_t = std::span<const uint32_t>;

inline constexpr std::size_t kWordSize = 4;
inline constexpr std::size_t kDigestWords = 8;
inline constexpr std::size_t kDigestBytes = kDigestWords * kWordSize;
inline constexpr std::size_t kBlockWords = kDigestWords * 2;
inline constexpr std::size_t kBlockBytes = kBlockWords * kWordSize;

bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
bytes_view_t make_bytes_view(const words_view_t& words);

/// Seal words as little-endian bytes.
bytes_t make_le_bytes(const words_view_t& words);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace zkreceipt::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
