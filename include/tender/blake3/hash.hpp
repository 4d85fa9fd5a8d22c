#pragma once
#include <blake3.h>
#include <tender/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace tender::blake3 {

/// Incremental BLAKE3 with a 32-byte output.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const tender::schema::bytes_view_t& bytes);
  tender::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

tender::schema::hash32_t hash(const std::string_view& str);
tender::schema::hash32_t hash(const tender::schema::bytes_view_t& bytes);

}  // namespace tender::blake3
