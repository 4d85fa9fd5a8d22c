#include <tender/common/critical.hpp>
#include <tender/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace tender::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    tender::common::critical("invalid hex input");
  }
  return *decoded;
}

std::optional<hash32_t> try_make_hash32(const std::string_view hex) {
  return try_make_fixed<32>(hex);
}

std::optional<address_t> try_make_address(const std::string_view hex) {
  return try_make_fixed<20>(hex);
}

std::optional<signature_t> try_make_signature(const std::string_view hex) {
  return try_make_fixed<65>(hex);
}

std::optional<private_key_t> try_make_private_key(const std::string_view hex) {
  return try_make_fixed<32>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

address_t make_zero_address() {
  return {};
}

bool is_zero(const address_t& address) {
  return std::all_of(std::begin(address), std::end(address),
                     [](const uint8_t byte) { return byte == 0; });
}

std::string to_string(const address_t& address) {
  return "0x" + to_hex(address);
}

std::string to_string(const hash32_t& hash) {
  return "0x" + to_hex(hash);
}

word_t to_word(const amount_t& value) {
  auto digits = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(digits), 8);
  auto word = word_t{};
  // export_bits emits the minimal big-endian representation.
  std::copy(std::begin(digits), std::end(digits),
            std::end(word) - static_cast<std::ptrdiff_t>(digits.size()));
  return word;
}

word_t to_word(const uint64_t value) {
  auto word = word_t{};
  for (size_t i = 0; i < sizeof(uint64_t); ++i) {
    word[word.size() - 1 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
  }
  return word;
}

amount_t from_word(const word_t& word) {
  auto value = amount_t{};
  boost::multiprecision::import_bits(value, std::begin(word), std::end(word));
  return value;
}

std::optional<amount_t> try_make_amount(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto hex = normalize_hex(text);
  auto is_hex = hex.size() != text.size();
  if (hex.empty()) {
    return std::nullopt;
  }
  static const auto kMax =
      boost::multiprecision::cpp_int{std::numeric_limits<amount_t>::max()};
  auto value = boost::multiprecision::cpp_int{};
  for (const auto c : hex) {
    if (is_hex) {
      auto nibble = hex_nibble(c);
      if (!nibble) {
        return std::nullopt;
      }
      value = (value << 4) + *nibble;
    } else {
      if (c < '0' || c > '9') {
        return std::nullopt;
      }
      value = (value * 10) + (c - '0');
    }
    if (value > kMax) {
      return std::nullopt;
    }
  }
  return static_cast<amount_t>(value);
}

}  // namespace tender::schema
