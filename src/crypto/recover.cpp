#include <tender/crypto/keccak.hpp>
#include <tender/crypto/recover.hpp>

#include <openssl/rand.h>
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <memory>

namespace tender::crypto {

namespace {

using secp_context_ptr =
    std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

// n / 2 for secp256k1; signatures with a larger `s` are malleable twins.
constexpr auto kHalfOrder = std::array<uint8_t, 32>{
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4,
    0x50, 0x1D, 0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0};

secp_context_ptr make_context() {
  auto context = secp_context_ptr{
      secp256k1_context_create(SECP256K1_CONTEXT_SIGN |
                               SECP256K1_CONTEXT_VERIFY),
      secp256k1_context_destroy};
  if (!context) {
    return context;
  }
  auto seed = std::array<uint8_t, 32>{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1 ||
      secp256k1_context_randomize(context.get(), seed.data()) != 1) {
    spdlog::warn("secp256k1 context randomization failed");
  }
  return context;
}

const secp256k1_context* context() {
  static const auto instance = make_context();
  return instance.get();
}

std::optional<tender::schema::address_t> address_of_public_key(
    const secp256k1_pubkey& public_key) {
  auto serialized = std::array<uint8_t, 65>{};
  auto length = serialized.size();
  if (secp256k1_ec_pubkey_serialize(context(), serialized.data(), &length,
                                    &public_key,
                                    SECP256K1_EC_UNCOMPRESSED) != 1 ||
      length != serialized.size()) {
    return std::nullopt;
  }
  // Skip the 0x04 prefix.
  auto hash = keccak256(
      tender::schema::bytes_view_t{serialized.data() + 1, length - 1});
  auto address = tender::schema::address_t{};
  std::copy(std::end(hash) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(hash), std::begin(address));
  return address;
}

}  // namespace

bool available() {
  return context() != nullptr;
}

std::optional<tender::schema::address_t> recover_signer(
    const tender::schema::hash32_t& digest,
    const tender::schema::signature_t& signature) {
  if (!available()) {
    return std::nullopt;
  }

  const auto v = signature[64];
  if (v != 27 && v != 28) {
    return std::nullopt;
  }
  const auto* s = signature.data() + 32;
  if (std::lexicographical_compare(std::begin(kHalfOrder),
                                   std::end(kHalfOrder), s, s + 32)) {
    return std::nullopt;
  }

  auto recoverable = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(
          context(), &recoverable, signature.data(), v - 27) != 1) {
    return std::nullopt;
  }

  auto public_key = secp256k1_pubkey{};
  if (secp256k1_ecdsa_recover(context(), &public_key, &recoverable,
                              digest.data()) != 1) {
    return std::nullopt;
  }
  return address_of_public_key(public_key);
}

std::optional<tender::schema::signature_t> sign_digest(
    const tender::schema::private_key_t& private_key,
    const tender::schema::hash32_t& digest) {
  if (!available() ||
      secp256k1_ec_seckey_verify(context(), private_key.data()) != 1) {
    return std::nullopt;
  }

  auto recoverable = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_sign_recoverable(context(), &recoverable, digest.data(),
                                       private_key.data(), nullptr,
                                       nullptr) != 1) {
    return std::nullopt;
  }

  auto signature = tender::schema::signature_t{};
  auto recovery_id = 0;
  if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
          context(), signature.data(), &recovery_id, &recoverable) != 1) {
    return std::nullopt;
  }
  // Ethereum style `v` only encodes the parity of R.y.
  if (recovery_id > 1) {
    return std::nullopt;
  }
  signature[64] = static_cast<uint8_t>(27 + recovery_id);
  return signature;
}

std::optional<tender::schema::address_t> address_of(
    const tender::schema::private_key_t& private_key) {
  if (!available() ||
      secp256k1_ec_seckey_verify(context(), private_key.data()) != 1) {
    return std::nullopt;
  }
  auto public_key = secp256k1_pubkey{};
  if (secp256k1_ec_pubkey_create(context(), &public_key, private_key.data()) !=
      1) {
    return std::nullopt;
  }
  return address_of_public_key(public_key);
}

std::optional<tender::schema::private_key_t> generate_private_key() {
  auto private_key = tender::schema::private_key_t{};
  // A uniformly random 32-byte string is a valid key with overwhelming
  // probability; retry the rare miss.
  for (auto attempt = 0; attempt < 8; ++attempt) {
    if (RAND_bytes(private_key.data(), static_cast<int>(private_key.size())) !=
        1) {
      return std::nullopt;
    }
    if (available() &&
        secp256k1_ec_seckey_verify(context(), private_key.data()) == 1) {
      return private_key;
    }
  }
  return std::nullopt;
}

}  // namespace tender::crypto
