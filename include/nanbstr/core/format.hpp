#ifndef NANBSTR_CORE_FORMAT_HPP
#define NANBSTR_CORE_FORMAT_HPP

#include "nanbstr/core/bits.hpp"

namespace nanbstr {

// Bit geometry of an IEEE 754 binary interchange format: [S][E][F].
//
// Describes where the fields sit in the storage word and which masks
// select them. Says nothing about what a particular pattern means —
// that's validation's job.
template <int ExpBits, int FracBits>
struct InterchangeFormat {
  static constexpr int sign_bits = 1;
  static constexpr int exp_bits = ExpBits;
  static constexpr int frac_bits = FracBits;
  static constexpr int total_bits = 1 + ExpBits + FracBits;
  static constexpr int total_bytes = total_bits / 8;

  // The most significant fraction bit is the quiet/signaling indicator;
  // everything below it is payload.
  static constexpr int payload_bits = FracBits - 1;

  static constexpr int sign_offset = ExpBits + FracBits;
  static constexpr int exp_offset = FracBits;
  static constexpr int quiet_offset = FracBits - 1;

  using storage_type = bits_t<total_bits>;

  static constexpr storage_type exp_max =
      (storage_type{1} << ExpBits) - 1;
  static constexpr storage_type sign_mask = storage_type{1} << sign_offset;
  static constexpr storage_type exp_mask = exp_max << exp_offset;
  static constexpr storage_type frac_mask = (storage_type{1} << FracBits) - 1;
  static constexpr storage_type quiet_mask = storage_type{1} << quiet_offset;
  static constexpr storage_type payload_mask = quiet_mask - 1;

  static_assert(ExpBits >= 2, "exponent field must be at least 2 bits");
  static_assert(FracBits >= 2,
                "fraction needs a quiet bit and at least one payload bit");
  static_assert(total_bits % 8 == 0, "interchange formats are whole bytes");
  static_assert(total_bits <= 128, "widest interchange format is binary128");
};

using binary16 = InterchangeFormat<5, 10>;
using binary32 = InterchangeFormat<8, 23>;
using binary64 = InterchangeFormat<11, 52>;
using binary128 = InterchangeFormat<15, 112>;

// Runtime view of the same geometry, for code that only learns the
// width from a byte count.
struct FieldLayout {
  int ExpBits;
  int FracBits;
  int TotalBits;

  constexpr int payloadBits() const { return FracBits - 1; }
  constexpr int totalBytes() const { return TotalBits / 8; }
};

template <typename Fmt>
constexpr FieldLayout layoutFor() {
  return {Fmt::exp_bits, Fmt::frac_bits, Fmt::total_bits};
}

} // namespace nanbstr

#endif // NANBSTR_CORE_FORMAT_HPP
