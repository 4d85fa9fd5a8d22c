#pragma once

#include <tender/schema/enum_string.hpp>

#include <cstdint>

// Schema type: error code.
// Hard-fail outcome of offer creation, delegation, settlement and signer
// lookup. Zero is success.
namespace tender::schema {

enum class error_code : uint32_t {
  ok = 0,
  invalid_parameter = 1,
  not_found = 2,
  unauthorized = 3,
  inconsistent_offer = 4,
  invalid_delegate = 5,
  invalid_signature = 6,
  transfer_failed = 7,
};

inline constexpr auto kErrorCodeNames = enum_names<error_code, 8>{
    {"ok", "invalid_parameter", "not_found", "unauthorized",
     "inconsistent_offer", "invalid_delegate", "invalid_signature",
     "transfer_failed"}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return kErrorCodeNames.parse(value);
}

inline constexpr std::string_view to_string(const error_code value) {
  return kErrorCodeNames.name_of(value).value_or("unknown");
}

}  // namespace tender::schema
