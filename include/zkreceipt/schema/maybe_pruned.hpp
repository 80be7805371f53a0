#pragma once
#include <zkreceipt/common/error.hpp>
#include <zkreceipt/hash/hash_engine.hpp>
#include <zkreceipt/schema/digest.hpp>
#include <zkreceipt/schema/digestible.hpp>

#include <utility>
#include <variant>

namespace zkreceipt::schema {

/// Either a full value or only its digest.
///
/// digest() is the same whichever form is held, so any subtree of a claim can
/// be replaced by its digest without changing the digest of its ancestors.
template <typename T>
class maybe_pruned final {
 public:
  using value_type = T;

  /// Decode target only; holds the zero digest.
  maybe_pruned() : value_{std::in_place_index<1>, digest_t{}} {}

  maybe_pruned(T value) : value_{std::in_place_index<0>, std::move(value)} {}

  static maybe_pruned pruned(const digest_t& digest) {
    auto out = maybe_pruned{};
    out.value_.template emplace<1>(digest);
    return out;
  }

  bool is_value() const { return value_.index() == 0; }
  bool is_pruned() const { return value_.index() == 1; }

  const T* as_value() const { return std::get_if<0>(&value_); }
  const digest_t* as_pruned() const { return std::get_if<1>(&value_); }

  /// The full value; throws receipt_format_error when pruned.
  const T& value() const {
    const auto* held = as_value();
    if (held == nullptr) {
      throw zkreceipt::common::receipt_format_error{
          "expected value, found pruned digest"};
    }
    return *held;
  }

  digest_t digest(const zkreceipt::hash::hash_engine& engine) const {
    if (const auto* held = as_value()) {
      return digest_of(*held, engine);
    }
    return *as_pruned();
  }

  /// Replace the value by its digest.
  maybe_pruned prune(const zkreceipt::hash::hash_engine& engine) const {
    return pruned(digest(engine));
  }

  bool operator==(const maybe_pruned&) const = default;

 private:
  std::variant<T, digest_t> value_;
};

}  // namespace zkreceipt::schema
