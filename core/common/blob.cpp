/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(sealbox::common, BlobError, e) {
  using sealbox::common::BlobError;
  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Byte length does not match the blob size";
  }
  return "Unknown blob error";
}

namespace sealbox::common {

  template class Blob<32ul>;
  template class Blob<64ul>;

}  // namespace sealbox::common
