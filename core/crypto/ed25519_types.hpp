/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}

#include "common/blob.hpp"
#include "crypto/secret.hpp"

namespace sealbox::crypto {

  namespace constants::ed25519 {
    constexpr size_t kSecretKeySize = ED25519_SECRET_KEY_LENGTH;
    constexpr size_t kPublicKeySize = ED25519_PUBLIC_KEY_LENGTH;
    constexpr size_t kSignatureSize = ED25519_SIGNATURE_LENGTH;
    constexpr size_t kSeedSize = kSecretKeySize;
  }  // namespace constants::ed25519

  struct Ed25519PublicKeyTag;
  /// Also serves as the node identity in receipts
  using Ed25519PublicKey =
      common::TaggedBlob<constants::ed25519::kPublicKeySize,
                         Ed25519PublicKeyTag>;

  struct Ed25519SignatureTag;
  using Ed25519Signature =
      common::TaggedBlob<constants::ed25519::kSignatureSize,
                         Ed25519SignatureTag>;

  struct Ed25519SecretKeyTag;
  using Ed25519PrivateKey =
      SecretBlob<constants::ed25519::kSecretKeySize, Ed25519SecretKeyTag>;

  struct Ed25519SeedTag;
  using Ed25519Seed =
      SecretBlob<constants::ed25519::kSeedSize, Ed25519SeedTag>;

  struct Ed25519Keypair {
    Ed25519PrivateKey secret_key;
    Ed25519PublicKey public_key;

    bool operator==(const Ed25519Keypair &) const = default;
  };

}  // namespace sealbox::crypto
