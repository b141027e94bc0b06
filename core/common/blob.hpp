/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <ostream>

#include <fmt/format.h>
#include <boost/functional/hash.hpp>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

namespace sealbox::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  using byte_t = uint8_t;

  /**
   * Fixed-size byte string. Digests, commitments, keys and signatures of
   * receipts are all blobs.
   */
  template <size_t N>
  class Blob : public std::array<byte_t, N> {
   public:
    using Array = std::array<byte_t, N>;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &bytes) : Array{bytes} {}

    static constexpr size_t size() {
      return N;
    }

    const Array &asArray() const {
      return *this;
    }

    BufferView view() const {
      return {this->data(), N};
    }

    std::string toHex() const {
      return hex_lower(view());
    }

    /// Copies exactly N bytes, any other length is INCORRECT_LENGTH
    static outcome::result<Blob> fromSpan(BufferView bytes) {
      if (bytes.size() != N) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob blob;
      std::ranges::copy(bytes, blob.begin());
      return blob;
    }

    /// Parses 2*N hex digits without a prefix
    static outcome::result<Blob> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }
  };

  /**
   * Blob which does not convert implicitly to blobs of other meaning with the
   * same size, e.g. a public key and a digest.
   */
  template <size_t N, typename Tag>
  class TaggedBlob : public Blob<N> {
   public:
    using Base = Blob<N>;

    TaggedBlob() = default;

    explicit TaggedBlob(const Base &blob) : Base{blob} {}

    static outcome::result<TaggedBlob> fromSpan(BufferView bytes) {
      OUTCOME_TRY(blob, Base::fromSpan(bytes));
      return TaggedBlob{blob};
    }

    static outcome::result<TaggedBlob> fromHex(std::string_view hex) {
      OUTCOME_TRY(blob, Base::fromHex(hex));
      return TaggedBlob{blob};
    }
  };

  extern template class Blob<32ul>;
  extern template class Blob<64ul>;

  /// SHA-256 digest
  using Hash256 = Blob<32>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace sealbox::common

template <size_t N>
struct std::hash<sealbox::common::Blob<N>> {
  size_t operator()(const sealbox::common::Blob<N> &blob) const {
    return boost::hash_range(blob.begin(), blob.end());
  }
};

template <size_t N, typename Tag>
struct std::hash<sealbox::common::TaggedBlob<N, Tag>>
    : std::hash<sealbox::common::Blob<N>> {};

/**
 * Formats a blob as 0x-prefixed hex. The 's' presentation (default for blobs
 * longer than 4 bytes) keeps the two leading and two trailing bytes only,
 * 'l' prints every byte.
 */
template <size_t N>
struct fmt::formatter<sealbox::common::Blob<N>> {
  bool full = N <= 4;

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() and (*it == 's' or *it == 'l')) {
      full = *it++ == 'l';
    }
    if (it != ctx.end() and *it != '}') {
      throw format_error("blob format is one of {:s} or {:l}");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const sealbox::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (full) {
      return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
    }
    return fmt::format_to(ctx.out(),
                          "0x{}…{}",
                          sealbox::common::hex_lower(blob.view().first(2)),
                          sealbox::common::hex_lower(blob.view().last(2)));
  }
};

template <size_t N, typename Tag>
struct fmt::formatter<sealbox::common::TaggedBlob<N, Tag>>
    : fmt::formatter<sealbox::common::Blob<N>> {};

OUTCOME_HPP_DECLARE_ERROR(sealbox::common, BlobError);
