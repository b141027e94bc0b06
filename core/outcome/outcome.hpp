/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/outcome/outcome.hpp>

/**
 * Error handling of sealbox is built on outcome::result<T>, every error enum
 * is registered with OUTCOME_HPP_DECLARE_ERROR in its header and described
 * with OUTCOME_CPP_DEFINE_CATEGORY in the matching source file.
 */
namespace outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace outcome
