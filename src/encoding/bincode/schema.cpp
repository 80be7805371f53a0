#include <zkreceipt/common/critical.hpp>
#include <zkreceipt/common/error.hpp>
#include <zkreceipt/encoding/bincode/codec.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <iterator>

namespace zkreceipt::encoding::bincode {

namespace {

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
// Returns the offset of the first bad sequence, or the size when valid.
std::size_t find_invalid_utf8(const zkreceipt::schema::bytes_view_t& bytes) {
  auto i = std::size_t{0};
  while (i < bytes.size()) {
    auto lead = bytes[i];
    if (lead < 0x80) {
      ++i;
      continue;
    }
    auto length = std::size_t{0};
    auto min = uint32_t{0};
    auto cp = uint32_t{0};
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      min = 0x80;
      cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      min = 0x800;
      cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      min = 0x10000;
      cp = lead & 0x07;
    } else {
      return i;
    }
    if (bytes.size() - i < length) {
      return i;
    }
    for (auto k = std::size_t{1}; k < length; ++k) {
      auto next = bytes[i + k];
      if ((next & 0xC0) != 0x80) {
        return i;
      }
      cp = (cp << 6) | (next & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return i;
    }
    i += length;
  }
  return i;
}

}  // namespace

void encode(const uint32_t o, writer& w) {
  w.write_u32(o);
}

void decode(uint32_t& o, reader& r) {
  o = r.read_u32();
}

void encode(const std::string& o, writer& w) {
  w.write_length(o.size());
  w.write_bytes(zkreceipt::schema::make_bytes_view(o));
}

void decode(std::string& o, reader& r) {
  auto length = r.read_length(1);
  auto raw = r.read_bytes(length);
  if (auto bad = find_invalid_utf8(raw); bad != raw.size()) {
    throw zkreceipt::common::decode_error{
        fmt::format("invalid utf-8 in string at byte {}", bad)};
  }
  o.assign(std::begin(raw), std::end(raw));
}

void encode(const zkreceipt::schema::bytes_t& o, writer& w) {
  w.write_length(o.size());
  w.write_bytes(o);
}

void decode(zkreceipt::schema::bytes_t& o, reader& r) {
  auto length = r.read_length(1);
  auto raw = r.read_bytes(length);
  o.assign(std::begin(raw), std::end(raw));
}

// Eight little-endian u32 words, no length prefix.
void encode(const zkreceipt::schema::digest_t& o, writer& w) {
  for (const auto word : o.words()) {
    w.write_u32(word);
  }
}

void decode(zkreceipt::schema::digest_t& o, reader& r) {
  for (auto& word : o.words()) {
    word = r.read_u32();
  }
}

void encode(const zkreceipt::schema::exit_code_t& o, writer& w) {
  using kind = zkreceipt::schema::exit_code_t::kind;
  w.write_u32(static_cast<uint32_t>(o.get_kind()));
  if (o.get_kind() == kind::halted || o.get_kind() == kind::paused) {
    w.write_u32(o.user_code());
  }
}

void decode(zkreceipt::schema::exit_code_t& o, reader& r) {
  using zkreceipt::schema::exit_code_t;
  auto variant = r.read_u32();
  switch (static_cast<exit_code_t::kind>(variant)) {
    case exit_code_t::kind::halted:
      o = exit_code_t::halted(r.read_u32());
      return;
    case exit_code_t::kind::paused:
      o = exit_code_t::paused(r.read_u32());
      return;
    case exit_code_t::kind::system_split:
      o = exit_code_t::system_split();
      return;
    case exit_code_t::kind::session_limit:
      o = exit_code_t::session_limit();
      return;
  }
  throw zkreceipt::common::decode_error{
      fmt::format("invalid ExitCode variant index {}", variant)};
}

void encode(const zkreceipt::schema::system_state_t& o, writer& w) {
  encode(o.pc, w);
  encode(o.merkle_root, w);
}

void decode(zkreceipt::schema::system_state_t& o, reader& r) {
  decode(o.pc, r);
  decode(o.merkle_root, r);
}

void encode(const zkreceipt::schema::assumption_t& o, writer& w) {
  encode(o.claim, w);
  encode(o.control_root, w);
}

void decode(zkreceipt::schema::assumption_t& o, reader& r) {
  decode(o.claim, r);
  decode(o.control_root, r);
}

// Serialized as the bare sequence.
void encode(const zkreceipt::schema::assumptions_t& o, writer& w) {
  encode(o.items, w);
}

void decode(zkreceipt::schema::assumptions_t& o, reader& r) {
  decode(o.items, r);
}

void encode(const zkreceipt::schema::output_t& o, writer& w) {
  encode(o.journal, w);
  encode(o.assumptions, w);
}

void decode(zkreceipt::schema::output_t& o, reader& r) {
  decode(o.journal, r);
  decode(o.assumptions, r);
}

void encode(const zkreceipt::schema::receipt_claim_t& o, writer& w) {
  encode(o.pre, w);
  encode(o.post, w);
  encode(o.exit_code, w);
  encode(o.input, w);
  encode(o.output, w);
}

void decode(zkreceipt::schema::receipt_claim_t& o, reader& r) {
  decode(o.pre, r);
  decode(o.post, r);
  decode(o.exit_code, r);
  decode(o.input, r);
  decode(o.output, r);
}

void encode(const zkreceipt::schema::merkle_proof_t& o, writer& w) {
  encode(o.index, w);
  encode(o.digests, w);
}

void decode(zkreceipt::schema::merkle_proof_t& o, reader& r) {
  decode(o.index, r);
  decode(o.digests, r);
}

void encode(const zkreceipt::schema::unknown_claim_t&, writer&) {
  zkreceipt::common::critical("unknown_claim_t value reached the encoder");
}

void encode(const zkreceipt::schema::input_t&, writer&) {
  zkreceipt::common::critical("input_t value reached the encoder");
}

void decode(
    zkreceipt::schema::maybe_pruned<zkreceipt::schema::unknown_claim_t>& o,
    reader& r) {
  auto tag = r.read_u32();
  if (tag != kMaybePrunedPruned) {
    throw zkreceipt::common::decode_error{fmt::format(
        "unknown claim must be pruned, found variant index {}", tag)};
  }
  auto digest = zkreceipt::schema::digest_t{};
  decode(digest, r);
  o = zkreceipt::schema::maybe_pruned<
      zkreceipt::schema::unknown_claim_t>::pruned(digest);
}

void decode(std::optional<zkreceipt::schema::input_t>& o, reader& r) {
  auto tag = r.read_u8();
  if (tag != kOptionNone) {
    throw zkreceipt::common::decode_error{
        fmt::format("input must be absent, found Option tag {}", tag)};
  }
  o.reset();
}

}  // namespace zkreceipt::encoding::bincode
