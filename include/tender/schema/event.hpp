#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: event.
// Notification emitted by state-changing operations and appended to the
// event journal.
namespace tender::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using event_attribute_t = event_attribute<1>;

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;

  /// Value of the first attribute named `key`.
  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& item : attributes) {
      if (item.key == key) {
        return item.value;
      }
    }
    return std::nullopt;
  }
};

using event_t = event<1>;

inline constexpr auto kOfferCreatedEvent = std::string_view{"offer_created"};
inline constexpr auto kDelegationChangedEvent =
    std::string_view{"delegation_changed"};
inline constexpr auto kSettlementCompletedEvent =
    std::string_view{"settlement_completed"};

}  // namespace tender::schema
