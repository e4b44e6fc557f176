#pragma once

#include <bastion/schema/primitives.hpp>

#include <optional>

namespace bastion::crypto {

using private_key_t = std::array<uint8_t, 32>;

bool available();

std::optional<private_key_t> generate_private_key();

std::optional<bastion::schema::public_key_t> derive_public_key(
    const private_key_t& key);

/// Produces [r || s || v] with low-s and v in {0, 1}.
std::optional<bastion::schema::recoverable_signature_t> sign_recoverable(
    const bastion::schema::hash32_t& digest,
    const private_key_t& key);

/// Accepts v in {0, 1} or {27, 28}. Returns std::nullopt for any signature
/// that does not recover to a valid curve point.
std::optional<bastion::schema::public_key_t> recover_public_key(
    const bastion::schema::hash32_t& digest,
    const bastion::schema::recoverable_signature_t& signature);

bastion::schema::identity_t identity_of(
    const bastion::schema::public_key_t& public_key);

/// Identity of the signer of `digest`, or the null identity when `approval`
/// is not a recoverable 65-byte signature.
bastion::schema::identity_t recover_identity(
    const bastion::schema::hash32_t& digest,
    const bastion::schema::bytes_view_t& approval);

}  // namespace bastion::crypto
