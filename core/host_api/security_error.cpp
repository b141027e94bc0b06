/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host_api/security_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::host_api, SecurityError, e) {
  using E = sealbox::host_api::SecurityError;
  switch (e) {
    case E::CAPABILITY_DENIED:
      return "Import is not covered by the granted capabilities";
  }
  return "Unknown security error";
}
