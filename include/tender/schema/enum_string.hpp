#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace tender::schema {

/// Wire names of an enum whose values run densely from 0 to N - 1. The name
/// of value `v` lives at `names[v]`.
template <typename Enum, std::size_t N>
struct enum_names final {
  std::array<std::string_view, N> names;

  constexpr std::optional<std::string_view> name_of(const Enum value) const {
    auto index = static_cast<std::size_t>(value);
    if (index >= N) {
      return std::nullopt;
    }
    return names[index];
  }

  constexpr std::optional<Enum> parse(const std::string_view value) const {
    for (auto index = std::size_t{0}; index < N; ++index) {
      if (names[index] == value) {
        return static_cast<Enum>(index);
      }
    }
    return std::nullopt;
  }
};

/// Parse a wire name. Specialized next to each enum that has one.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace tender::schema
