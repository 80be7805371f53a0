#include <zkreceipt/common/error.hpp>
#include <zkreceipt/hash/hash_suite.hpp>
#include <zkreceipt/hash/sha256.hpp>

#include <array>
#include <utility>

namespace zkreceipt::hash {

namespace {

const sha256_engine& sha256() {
  static const auto engine = sha256_engine{};
  return engine;
}

using registration_t = std::pair<std::string_view, const hash_engine*>;

const auto& registry() {
  static const auto engines = std::array<registration_t, 1>{{
      {sha256_engine::kName, &sha256()},
  }};
  return engines;
}

}  // namespace

const hash_engine* find_hash_engine(const std::string_view name) {
  for (const auto& [registered, engine] : registry()) {
    if (registered == name) {
      return engine;
    }
  }
  return nullptr;
}

const hash_engine& hash_engine_from_name(const std::string_view name) {
  const auto* engine = find_hash_engine(name);
  if (engine == nullptr) {
    throw zkreceipt::common::unsupported_hash_function_error{name};
  }
  return *engine;
}

const hash_engine& default_hash_engine() {
  return sha256();
}

}  // namespace zkreceipt::hash
