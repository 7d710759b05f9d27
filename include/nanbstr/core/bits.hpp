#ifndef NANBSTR_CORE_BITS_HPP
#define NANBSTR_CORE_BITS_HPP

// bits_t<N>: a fixed-width bit container parameterized on width.
//
// Not an integer semantically — a bag of bits. Supports shift, mask,
// OR, AND, comparison. The underlying type is _BitInt(N) on Clang,
// with a fallback to standard types / __int128 on GCC.
//
// Also provides big-endian load/store between bit containers and byte
// sequences, since every NaN pattern travels in network byte order.

#include <cstddef>
#include <cstdint>

namespace nanbstr {

#if defined(__clang__)

template <int N>
using bits_t = unsigned _BitInt(N);

#elif defined(__SIZEOF_INT128__)

namespace detail {

template <int N>
struct BitsStorage {
  static_assert(N > 0 && N <= 128,
                "GCC fallback limited to 128 bits; use Clang for wider types");
};

template <int N>
  requires(N > 0 && N <= 8)
struct BitsStorage<N> {
  using type = uint8_t;
};

template <int N>
  requires(N > 8 && N <= 16)
struct BitsStorage<N> {
  using type = uint16_t;
};

template <int N>
  requires(N > 16 && N <= 32)
struct BitsStorage<N> {
  using type = uint32_t;
};

template <int N>
  requires(N > 32 && N <= 64)
struct BitsStorage<N> {
  using type = uint64_t;
};

template <int N>
  requires(N > 64 && N <= 128)
struct BitsStorage<N> {
  using type = unsigned __int128;
};

} // namespace detail

template <int N>
using bits_t = typename detail::BitsStorage<N>::type;

#else
#error "Requires Clang (_BitInt) or GCC (__int128)"
#endif

// Widest pattern we carry. Fraction and payload fields of every width are
// returned in this type.
using uint128 = bits_t<128>;

// Read Count bytes as an unsigned big-endian integer. Count <= sizeof(T).
template <typename BitsType>
constexpr BitsType loadBigEndian(const uint8_t *Mem, std::size_t Count) {
  BitsType Val{0};
  for (std::size_t I = 0; I < Count; ++I)
    Val = static_cast<BitsType>((Val << 8) | BitsType(Mem[I]));
  return Val;
}

// Write the low Count bytes of Val, most significant first.
template <typename BitsType>
constexpr void storeBigEndian(BitsType Val, uint8_t *Mem, std::size_t Count) {
  for (std::size_t I = Count; I > 0; --I) {
    Mem[I - 1] = static_cast<uint8_t>(Val & BitsType{0xFF});
    Val = static_cast<BitsType>(Val >> 8);
  }
}

// Helper for two-word binary128 construction.
constexpr uint128 makeUint128(uint64_t High, uint64_t Low) {
  return (uint128(High) << 64) | uint128(Low);
}

} // namespace nanbstr

#endif // NANBSTR_CORE_BITS_HPP
