#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tender::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using word_t = hash32_t;  // 32-byte big-endian ABI word
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using private_key_t = std::array<uint8_t, 32>;

// r(32) || s(32) || v(1), v in {27, 28}.
using signature_t = std::array<uint8_t, 65>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::optional<hash32_t> try_make_hash32(const std::string_view hex);
std::optional<address_t> try_make_address(const std::string_view hex);
std::optional<signature_t> try_make_signature(const std::string_view hex);
std::optional<private_key_t> try_make_private_key(const std::string_view hex);

hash32_t make_zero_hash();
address_t make_zero_address();
bool is_zero(const address_t& address);

/// Checksum-free `0x`-prefixed lowercase rendering used in logs and events.
std::string to_string(const address_t& address);
std::string to_string(const hash32_t& hash);

/// Big-endian 32-byte word, the persisted and ABI form of an amount.
word_t to_word(const amount_t& value);
word_t to_word(uint64_t value);
amount_t from_word(const word_t& word);

/// Parse a decimal or `0x` hexadecimal amount; nullopt when the text is not
/// a number or does not fit in 256 bits.
std::optional<amount_t> try_make_amount(const std::string_view text);

}  // namespace tender::schema
