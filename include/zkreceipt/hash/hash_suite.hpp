#pragma once
#include <zkreceipt/hash/hash_engine.hpp>

#include <string_view>

namespace zkreceipt::hash {

/// Registered engine for a suite name, or nullptr when none is registered.
const hash_engine* find_hash_engine(std::string_view name);

/// As find_hash_engine, but throws unsupported_hash_function_error.
const hash_engine& hash_engine_from_name(std::string_view name);

/// The SHA-256 engine every receipt digest in this library is defined over.
const hash_engine& default_hash_engine();

}  // namespace zkreceipt::hash
