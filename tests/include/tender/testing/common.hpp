#pragma once

#include <tender/crypto/recover.hpp>
#include <tender/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tender::testing {

inline tender::schema::address_t make_address(const uint8_t seed) {
  auto out = tender::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Private key whose scalar value is `seed`.
inline tender::schema::private_key_t make_private_key(const uint8_t seed) {
  auto key = tender::schema::private_key_t{};
  key.back() = seed;
  return key;
}

inline tender::schema::address_t address_of(
    const tender::schema::private_key_t& key) {
  return tender::crypto::address_of(key).value();
}

inline tender::schema::amount_t make_amount(const std::string_view text) {
  return tender::schema::try_make_amount(text).value();
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tender::testing
