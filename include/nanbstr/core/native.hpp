#ifndef NANBSTR_CORE_NATIVE_HPP
#define NANBSTR_CORE_NATIVE_HPP

// Bridge between NanBstr and the host's float/double. Optional: nothing
// in the validated core depends on it, and it only covers the widths the
// host has native types for.
//
// Bit patterns are moved with std::bit_cast, so signaling NaNs and their
// payloads survive as long as the value is not passed through arithmetic.

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>

#include "nanbstr/core/nan_bstr.hpp"

namespace nanbstr {

static_assert(std::numeric_limits<float>::is_iec559 && sizeof(float) == 4,
              "float must be IEEE 754 binary32");
static_assert(std::numeric_limits<double>::is_iec559 && sizeof(double) == 8,
              "double must be IEEE 754 binary64");

inline Result<NanBstr> fromFloat(float F) {
  if (!std::isnan(F))
    return Status::NotANan;
  return NanBstr::fromBinary32Bits(std::bit_cast<uint32_t>(F));
}

inline Result<NanBstr> fromDouble(double D) {
  if (!std::isnan(D))
    return Status::NotANan;
  return NanBstr::fromBinary64Bits(std::bit_cast<uint64_t>(D));
}

// Fails with InvalidLength unless N is binary32.
inline Result<float> toFloat(const NanBstr &N) {
  if (N.width() != Width::Binary32)
    return Status::InvalidLength;
  auto Bits = loadBigEndian<uint32_t>(N.bytes().data(), 4);
  return std::bit_cast<float>(Bits);
}

// Fails with InvalidLength unless N is binary64.
inline Result<double> toDouble(const NanBstr &N) {
  if (N.width() != Width::Binary64)
    return Status::InvalidLength;
  auto Bits = loadBigEndian<uint64_t>(N.bytes().data(), 8);
  return std::bit_cast<double>(Bits);
}

} // namespace nanbstr

#endif // NANBSTR_CORE_NATIVE_HPP
