#ifndef NANBSTR_CBOR_ENCODER_HPP
#define NANBSTR_CBOR_ENCODER_HPP

// Deterministic CBOR encoder: definite lengths only, every argument in
// its shortest form. Floats are written at the width they carry.

#include <cstdint>
#include <vector>

#include "nanbstr/cbor/item.hpp"
#include "nanbstr/core/bits.hpp"

namespace nanbstr::cbor {

namespace detail {

// Additional-information values selecting a 1, 2, 4 or 8 byte argument.
inline constexpr uint8_t AiOneByte = 24;
inline constexpr uint8_t AiTwoBytes = 25;
inline constexpr uint8_t AiFourBytes = 26;
inline constexpr uint8_t AiEightBytes = 27;

inline void appendHead(std::vector<uint8_t> &Out, MajorType Type,
                       uint64_t Arg) {
  const uint8_t Major = static_cast<uint8_t>(Type) << 5;
  uint8_t Buf[8];
  if (Arg < AiOneByte) {
    Out.push_back(static_cast<uint8_t>(Major | Arg));
  } else if (Arg <= 0xFF) {
    Out.push_back(Major | AiOneByte);
    Out.push_back(static_cast<uint8_t>(Arg));
  } else if (Arg <= 0xFFFF) {
    Out.push_back(Major | AiTwoBytes);
    storeBigEndian<uint64_t>(Arg, Buf, 2);
    Out.insert(Out.end(), Buf, Buf + 2);
  } else if (Arg <= 0xFFFFFFFF) {
    Out.push_back(Major | AiFourBytes);
    storeBigEndian<uint64_t>(Arg, Buf, 4);
    Out.insert(Out.end(), Buf, Buf + 4);
  } else {
    Out.push_back(Major | AiEightBytes);
    storeBigEndian<uint64_t>(Arg, Buf, 8);
    Out.insert(Out.end(), Buf, Buf + 8);
  }
}

inline void appendFloat(std::vector<uint8_t> &Out, uint64_t Bits, int Bytes) {
  const uint8_t Major = static_cast<uint8_t>(MajorType::Simple) << 5;
  uint8_t Ai = Bytes == 2 ? AiTwoBytes : Bytes == 4 ? AiFourBytes
                                                    : AiEightBytes;
  uint8_t Buf[8];
  Out.push_back(Major | Ai);
  storeBigEndian<uint64_t>(Bits, Buf, static_cast<std::size_t>(Bytes));
  Out.insert(Out.end(), Buf, Buf + Bytes);
}

inline void encodeInto(std::vector<uint8_t> &Out, const Item &I) {
  switch (I.Type) {
  case MajorType::Unsigned:
  case MajorType::Negative:
    appendHead(Out, I.Type, I.Argument);
    break;
  case MajorType::ByteString:
  case MajorType::TextString:
    appendHead(Out, I.Type, I.Payload.size());
    Out.insert(Out.end(), I.Payload.begin(), I.Payload.end());
    break;
  case MajorType::Array:
    appendHead(Out, I.Type, I.Children.size());
    for (const Item &C : I.Children)
      encodeInto(Out, C);
    break;
  case MajorType::Map:
    appendHead(Out, I.Type, I.Children.size() / 2);
    for (const Item &C : I.Children)
      encodeInto(Out, C);
    break;
  case MajorType::Tagged:
    appendHead(Out, I.Type, I.Argument);
    encodeInto(Out, I.content());
    break;
  case MajorType::Simple:
    if (I.FloatBytes != 0)
      appendFloat(Out, I.Argument, I.FloatBytes);
    else
      appendHead(Out, I.Type, I.Argument);
    break;
  }
}

} // namespace detail

inline std::vector<uint8_t> encode(const Item &I) {
  std::vector<uint8_t> Out;
  detail::encodeInto(Out, I);
  return Out;
}

} // namespace nanbstr::cbor

#endif // NANBSTR_CBOR_ENCODER_HPP
