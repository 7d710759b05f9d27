#ifndef NANBSTR_CORE_NAN_BSTR_HPP
#define NANBSTR_CORE_NAN_BSTR_HPP

// NanBstr: the exact bit pattern of an IEEE 754 NaN, carried in CBOR as
// a byte string under tag 102.
//
// The byte string is 2, 4, 8 or 16 bytes, big-endian, and must encode a
// NaN at the matching width. Sign, quiet bit and payload are kept as
// given; nothing is canonicalized.

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "nanbstr/cbor/decoder.hpp"
#include "nanbstr/cbor/encoder.hpp"
#include "nanbstr/cbor/item.hpp"
#include "nanbstr/cbor/tags.hpp"
#include "nanbstr/core/bits.hpp"
#include "nanbstr/core/status.hpp"
#include "nanbstr/core/width.hpp"

namespace nanbstr {

class NanBstr {
public:
  // --- Construction ---

  // Validates length, then the NaN predicate at the derived width. The
  // bytes are copied.
  static Result<NanBstr> fromBytes(std::span<const uint8_t> Bytes) {
    Result<Width> W = widthForLength(Bytes.size());
    if (!W)
      return W.status();
    if (!isNanBitPattern(*W, Bytes))
      return Status::NotANan;
    return NanBstr(Bytes);
  }

  static Result<NanBstr> fromBinary16Bits(uint16_t Bits) {
    return fromPattern<binary16>(Bits);
  }
  static Result<NanBstr> fromBinary32Bits(uint32_t Bits) {
    return fromPattern<binary32>(Bits);
  }
  static Result<NanBstr> fromBinary64Bits(uint64_t Bits) {
    return fromPattern<binary64>(Bits);
  }
  static Result<NanBstr> fromBinary128Bits(uint128 Bits) {
    return fromPattern<binary128>(Bits);
  }

  // binary128 from its high and low 64-bit words.
  static Result<NanBstr> fromBinary128Words(uint64_t High, uint64_t Low) {
    return fromBinary128Bits(makeUint128(High, Low));
  }

  // --- Accessors ---

  // Never stored; recomputed from the byte count.
  Width width() const { return *widthForLength(Length); }

  std::span<const uint8_t> bytes() const {
    return std::span<const uint8_t>(Storage.data(), Length);
  }

  bool sign() const { return (Storage[0] & 0x80) != 0; }

  bool isQuiet() const {
    return ((fractionBits() >> layout().payloadBits()) & 1) != 0;
  }
  bool isSignaling() const { return !isQuiet(); }

  // The whole fraction field, quiet bit included.
  uint128 fractionBits() const {
    return detail::fractionField(layout(), detail::widePattern(bytes()));
  }

  // Fraction bits below the quiet bit.
  uint128 payloadBits() const {
    return fractionBits() & detail::lowMask(layout().payloadBits());
  }

  // The full pattern, only for binary128 values.
  std::optional<uint128> toBinary128Bits() const {
    if (width() != Width::Binary128)
      return std::nullopt;
    return detail::widePattern(bytes());
  }

  // --- CBOR ---

  static constexpr uint64_t tag() { return cbor::NanBstrTag; }

  cbor::Item untaggedCbor() const { return cbor::byteString(bytes()); }

  cbor::Item taggedCbor() const { return cbor::tagged(tag(), untaggedCbor()); }

  std::vector<uint8_t> toCborData() const { return cbor::encode(taggedCbor()); }

  // The content of tag 102. The wire is not trusted: the same length and
  // NaN checks as fromBytes() run again.
  static Result<NanBstr> fromUntaggedCbor(const cbor::Item &Content) {
    if (!Content.isByteString())
      return Status::WrongShape;
    return fromBytes(Content.Payload);
  }

  static Result<NanBstr> fromTaggedCbor(const cbor::Item &I) {
    if (!I.isTagged() || I.Children.size() != 1)
      return Status::WrongShape;
    if (I.tag() != tag())
      return Status::WrongTag;
    return fromUntaggedCbor(I.content());
  }

  static Result<NanBstr> fromCborData(std::span<const uint8_t> Data,
                                      const cbor::DecodeOptions &Opts = {}) {
    Result<cbor::Item> I = cbor::decode(Data, Opts);
    if (!I)
      return I.status();
    return fromTaggedCbor(*I);
  }

  // --- Display ---

  // NaN[32]: + quiet frac=0x400001 payload=0x1
  std::string toString() const {
    std::string Out = "NaN[" + std::to_string(bitCount(width())) + "]: ";
    Out += sign() ? "- " : "+ ";
    Out += isQuiet() ? "quiet" : "signaling";
    Out += " frac=0x";
    appendHex(Out, fractionBits());
    Out += " payload=0x";
    appendHex(Out, payloadBits());
    return Out;
  }

  friend std::ostream &operator<<(std::ostream &OS, const NanBstr &N) {
    return OS << N.toString();
  }

  // Byte-wise, not numeric: two different NaN patterns are never equal.
  friend bool operator==(const NanBstr &A, const NanBstr &B) {
    return std::ranges::equal(A.bytes(), B.bytes());
  }
  friend std::strong_ordering operator<=>(const NanBstr &A, const NanBstr &B) {
    auto L = A.bytes(), R = B.bytes();
    return std::lexicographical_compare_three_way(L.begin(), L.end(),
                                                  R.begin(), R.end());
  }

private:
  // Copies into inline storage, so a moved-from value keeps its pattern.
  explicit NanBstr(std::span<const uint8_t> Bytes)
      : Length(static_cast<uint8_t>(Bytes.size())) {
    std::copy(Bytes.begin(), Bytes.end(), Storage.begin());
  }

  template <typename Fmt>
  static Result<NanBstr> fromPattern(typename Fmt::storage_type Bits) {
    uint8_t Buf[Fmt::total_bytes];
    storeBigEndian(Bits, Buf, Fmt::total_bytes);
    return fromBytes(std::span<const uint8_t>(Buf, Fmt::total_bytes));
  }

  FieldLayout layout() const { return layoutOf(width()); }

  static void appendHex(std::string &Out, uint128 Val) {
    char Buf[32];
    int N = 0;
    do {
      Buf[N++] = "0123456789abcdef"[static_cast<int>(Val & 0xF)];
      Val >>= 4;
    } while (Val != 0);
    while (N > 0)
      Out.push_back(Buf[--N]);
  }

  std::array<uint8_t, binary128::total_bytes> Storage{};
  uint8_t Length = 0;
};

} // namespace nanbstr

namespace std {

template <> struct hash<nanbstr::NanBstr> {
  std::size_t operator()(const nanbstr::NanBstr &N) const noexcept {
    // FNV-1a over the pattern bytes.
    std::size_t H = 14695981039346656037ull;
    for (uint8_t B : N.bytes()) {
      H ^= B;
      H *= 1099511628211ull;
    }
    return H;
  }
};

} // namespace std

#endif // NANBSTR_CORE_NAN_BSTR_HPP
