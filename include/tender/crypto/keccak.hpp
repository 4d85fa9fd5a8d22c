#pragma once
#include <tender/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>

namespace tender::crypto {

/// Keccak-256 with the original 0x01 padding (Ethereum flavour, not
/// FIPS-202 SHA3-256).
class keccak256_hasher final {
 public:
  static constexpr std::size_t kRate = 136;

  keccak256_hasher& update(const tender::schema::bytes_view_t& bytes);
  keccak256_hasher& update(const std::string_view& str);
  tender::schema::hash32_t finalize();

 private:
  void absorb_block(const uint8_t* block);

  std::array<uint64_t, 25> state_{};
  std::array<uint8_t, kRate> buffer_{};
  std::size_t buffered_{};
};

tender::schema::hash32_t keccak256(const tender::schema::bytes_view_t& bytes);
tender::schema::hash32_t keccak256(const std::string_view& str);

}  // namespace tender::crypto
