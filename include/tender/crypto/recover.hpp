#pragma once

#include <tender/schema/primitives.hpp>

#include <optional>

namespace tender::crypto {

/// True once the secp256k1 context has been created and randomized.
bool available();

/// Recover the address that produced `signature` over `digest`.
///
/// Returns std::nullopt for malformed signatures: `v` outside {27, 28},
/// `r` or `s` out of range, `s` in the upper half of the curve order, or a
/// point that does not recover. A returned address still has to be compared
/// with the claimed signer by the caller.
std::optional<tender::schema::address_t> recover_signer(
    const tender::schema::hash32_t& digest,
    const tender::schema::signature_t& signature);

/// Sign a 32-byte digest, producing `r || s || v` with low `s` and
/// `v = 27 + recovery id`.
std::optional<tender::schema::signature_t> sign_digest(
    const tender::schema::private_key_t& private_key,
    const tender::schema::hash32_t& digest);

/// Address owning `private_key` (last 20 bytes of the keccak of the
/// uncompressed public key).
std::optional<tender::schema::address_t> address_of(
    const tender::schema::private_key_t& private_key);

/// Fresh private key from OpenSSL's CSPRNG.
std::optional<tender::schema::private_key_t> generate_private_key();

}  // namespace tender::crypto
