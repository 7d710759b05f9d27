#ifndef NANBSTR_CORE_WIDTH_HPP
#define NANBSTR_CORE_WIDTH_HPP

#include <cstddef>
#include <cstdint>
#include <span>

#include "nanbstr/core/bits.hpp"
#include "nanbstr/core/format.hpp"
#include "nanbstr/core/status.hpp"

namespace nanbstr {

// The four IEEE 754 binary interchange widths. Closed set: a fifth width
// would be a format change, not an extension point.
enum class Width {
  Binary16,  // half, 2 bytes
  Binary32,  // single, 4 bytes
  Binary64,  // double, 8 bytes
  Binary128, // quad, 16 bytes
};

// Width is a function of byte length alone.
inline Result<Width> widthForLength(std::size_t Len) {
  switch (Len) {
  case 2:  return Width::Binary16;
  case 4:  return Width::Binary32;
  case 8:  return Width::Binary64;
  case 16: return Width::Binary128;
  default: return Status::InvalidLength;
  }
}

constexpr FieldLayout layoutOf(Width W) {
  switch (W) {
  case Width::Binary16:  return layoutFor<binary16>();
  case Width::Binary32:  return layoutFor<binary32>();
  case Width::Binary64:  return layoutFor<binary64>();
  case Width::Binary128: return layoutFor<binary128>();
  }
  return layoutFor<binary128>();
}

constexpr std::size_t byteLength(Width W) {
  return static_cast<std::size_t>(layoutOf(W).totalBytes());
}

constexpr int bitCount(Width W) { return layoutOf(W).TotalBits; }

inline const char *widthName(Width W) {
  switch (W) {
  case Width::Binary16:  return "binary16";
  case Width::Binary32:  return "binary32";
  case Width::Binary64:  return "binary64";
  case Width::Binary128: return "binary128";
  }
  return "???";
}

namespace detail {

// Low Count bits set. Count < 128.
constexpr uint128 lowMask(int Count) {
  return (uint128{1} << Count) - 1;
}

// The whole pattern, zero-extended to 128 bits.
inline uint128 widePattern(std::span<const uint8_t> Bytes) {
  return loadBigEndian<uint128>(Bytes.data(), Bytes.size());
}

constexpr uint128 exponentField(const FieldLayout &L, uint128 Bits) {
  return (Bits >> L.FracBits) & lowMask(L.ExpBits);
}

constexpr uint128 fractionField(const FieldLayout &L, uint128 Bits) {
  return Bits & lowMask(L.FracBits);
}

} // namespace detail

// True iff Bytes, read big-endian at width W, has an all-ones exponent
// and a nonzero fraction. All-ones exponent with zero fraction is an
// infinity and is rejected. A length that disagrees with W is never a NaN.
inline bool isNanBitPattern(Width W, std::span<const uint8_t> Bytes) {
  const FieldLayout L = layoutOf(W);
  if (Bytes.size() != static_cast<std::size_t>(L.totalBytes()))
    return false;
  uint128 Bits = detail::widePattern(Bytes);
  return detail::exponentField(L, Bits) == detail::lowMask(L.ExpBits) &&
         detail::fractionField(L, Bits) != 0;
}

} // namespace nanbstr

#endif // NANBSTR_CORE_WIDTH_HPP
