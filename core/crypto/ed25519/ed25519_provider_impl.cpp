/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ed25519/ed25519_provider_impl.hpp"

#include <openssl/rand.h>

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::crypto, Ed25519ProviderImpl::Error, e) {
  using E = sealbox::crypto::Ed25519ProviderImpl::Error;
  switch (e) {
    case E::VERIFICATION_FAILED:
      return "Internal error during ed25519 signature verification";
    case E::SIGN_FAILED:
      return "Internal error during ed25519 signing";
    case E::ENTROPY_UNAVAILABLE:
      return "System random generator failed to produce an ed25519 seed";
  }
  return "Unknown error in ed25519 provider";
}

namespace sealbox::crypto {

  namespace {
    // schnorrkel keeps an ed25519 keypair as secret key followed by public key
    using KeypairBytes = std::array<uint8_t, ED25519_KEYPAIR_LENGTH>;
  }  // namespace

  Ed25519ProviderImpl::Ed25519ProviderImpl()
      : logger_{log::createLogger("Ed25519Provider", "crypto")} {}

  outcome::result<Ed25519Keypair> Ed25519ProviderImpl::generateKeypair(
      const Ed25519Seed &seed) const {
    KeypairBytes bytes{};
    WipeOnExit wipe{bytes};
    ed25519_keypair_from_seed(bytes.data(), seed.unsafeBytes().data());

    auto all = std::span<const uint8_t>(bytes);
    OUTCOME_TRY(secret_key,
                Ed25519PrivateKey::fromSpan(
                    all.first(constants::ed25519::kSecretKeySize)));
    OUTCOME_TRY(public_key,
                Ed25519PublicKey::fromSpan(
                    all.subspan(constants::ed25519::kSecretKeySize,
                                constants::ed25519::kPublicKeySize)));
    return Ed25519Keypair{
        .secret_key = std::move(secret_key),
        .public_key = public_key,
    };
  }

  outcome::result<Ed25519Keypair> Ed25519ProviderImpl::generateRandomKeypair()
      const {
    std::array<uint8_t, constants::ed25519::kSeedSize> entropy{};
    WipeOnExit wipe{entropy};
    if (RAND_bytes(entropy.data(), static_cast<int>(entropy.size())) != 1) {
      SL_ERROR(logger_, "RAND_bytes failed to produce a keypair seed");
      return Error::ENTROPY_UNAVAILABLE;
    }
    OUTCOME_TRY(seed, Ed25519Seed::fromSpan(entropy));
    return generateKeypair(seed);
  }

  outcome::result<Ed25519Signature> Ed25519ProviderImpl::sign(
      const Ed25519Keypair &keypair, common::BufferView message) const {
    KeypairBytes bytes{};
    WipeOnExit wipe{bytes};
    auto public_part =
        std::ranges::copy(keypair.secret_key.unsafeBytes(), bytes.begin()).out;
    std::ranges::copy(keypair.public_key, public_part);

    Ed25519Signature signature;
    auto res = ed25519_sign(
        signature.data(), bytes.data(), message.data(), message.size());
    if (res != ED25519_RESULT_OK) {
      SL_ERROR(
          logger_, "ed25519_sign failed with code {}", static_cast<int>(res));
      return Error::SIGN_FAILED;
    }
    return signature;
  }

  outcome::result<bool> Ed25519ProviderImpl::verify(
      const Ed25519Signature &signature,
      common::BufferView message,
      const Ed25519PublicKey &public_key) const {
    auto res = ed25519_verify(
        signature.data(), public_key.data(), message.data(), message.size());
    switch (res) {
      case ED25519_RESULT_OK:
        return true;
      case ED25519_RESULT_VERIFICATION_FAILED:
        return false;
      default:
        // e.g. a public key that is not a curve point
        SL_DEBUG(logger_,
                 "ed25519_verify failed with code {}",
                 static_cast<int>(res));
        return Error::VERIFICATION_FAILED;
    }
  }

}  // namespace sealbox::crypto
