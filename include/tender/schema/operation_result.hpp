#pragma once

#include <tender/schema/bid_violation.hpp>
#include <tender/schema/error_code.hpp>
#include <tender/schema/event.hpp>
#include <tender/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tender::schema {

template <uint16_t Version>
struct operation_result;

/// Outcome of a state-changing operation. `code` is an `error_code`; `data`
/// carries the SCALE-encoded return value when there is one.
template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<event_t> events;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

using operation_result_t = operation_result<1>;

template <uint16_t Version>
struct check_result;

/// Outcome of the pre-flight bid check. `code` is non-zero only when the
/// offer does not exist; rule failures are reported in `violations`.
template <>
struct check_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  uint64_t error_count{};
  std::vector<bid_violation> violations;
};

using check_result_t = check_result<1>;

template <uint16_t Version>
struct signer_result;

template <>
struct signer_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  address_t signer{};
};

using signer_result_t = signer_result<1>;

}  // namespace tender::schema
