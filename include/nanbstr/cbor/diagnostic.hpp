#ifndef NANBSTR_CBOR_DIAGNOSTIC_HPP
#define NANBSTR_CBOR_DIAGNOSTIC_HPP

// RFC 8949 diagnostic notation, e.g. 102(h'7e00').

#include <bit>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "nanbstr/cbor/item.hpp"
#include "nanbstr/cbor/tags.hpp"

namespace nanbstr::cbor {

struct DiagnosticOptions {
  // Follow each registered tag with a "/ name /" comment.
  bool Annotate = false;
  const TagRegistry *Registry = nullptr; // nullptr: the global registry
};

namespace detail {

inline void appendHexByte(std::string &Out, uint8_t B) {
  Out.push_back("0123456789abcdef"[B >> 4]);
  Out.push_back("0123456789abcdef"[B & 0xF]);
}

// Adapted from RFC 8949 appendix D.
inline double decodeHalf(uint16_t Half) {
  uint16_t Exp = (Half >> 10) & 0x1F;
  uint16_t Mant = Half & 0x3FF;
  double Val;
  if (Exp == 0)
    Val = std::ldexp(Mant, -24);
  else if (Exp != 31)
    Val = std::ldexp(Mant + 1024, Exp - 25);
  else
    Val = Mant == 0 ? std::numeric_limits<double>::infinity()
                    : std::numeric_limits<double>::quiet_NaN();
  return (Half & 0x8000) ? -Val : Val;
}

inline void appendFloat(std::string &Out, const Item &I) {
  double V;
  if (I.FloatBytes == 2)
    V = decodeHalf(static_cast<uint16_t>(I.Argument));
  else if (I.FloatBytes == 4)
    V = std::bit_cast<float>(static_cast<uint32_t>(I.Argument));
  else
    V = std::bit_cast<double>(I.Argument);

  if (std::isnan(V)) {
    Out += "NaN";
    return;
  }
  if (std::isinf(V)) {
    Out += V < 0 ? "-Infinity" : "Infinity";
    return;
  }
  char Buf[64];
  auto Res = std::to_chars(Buf, Buf + sizeof(Buf), V);
  std::string Text(Buf, Res.ptr);
  if (Text.find_first_of(".en") == std::string::npos)
    Text += ".0";
  Out += Text;
}

inline void appendNegative(std::string &Out, uint64_t N) {
  // -1 - N, which does not fit in int64_t for the largest N.
  if (N == std::numeric_limits<uint64_t>::max()) {
    Out += "-18446744073709551616";
    return;
  }
  Out += '-';
  Out += std::to_string(N + 1);
}

inline void appendText(std::string &Out, const std::vector<uint8_t> &Bytes) {
  Out.push_back('"');
  for (uint8_t C : Bytes) {
    if (C < 0x20) {
      Out += "\\u00";
      appendHexByte(Out, C);
      continue;
    }
    if (C == '"' || C == '\\')
      Out.push_back('\\');
    Out.push_back(static_cast<char>(C));
  }
  Out.push_back('"');
}

inline void appendItem(std::string &Out, const Item &I,
                       const DiagnosticOptions &Opts) {
  switch (I.Type) {
  case MajorType::Unsigned:
    Out += std::to_string(I.Argument);
    break;
  case MajorType::Negative:
    appendNegative(Out, I.Argument);
    break;
  case MajorType::ByteString:
    Out += "h'";
    for (uint8_t B : I.Payload)
      appendHexByte(Out, B);
    Out += "'";
    break;
  case MajorType::TextString:
    appendText(Out, I.Payload);
    break;
  case MajorType::Array:
    Out += '[';
    for (std::size_t K = 0; K < I.Children.size(); ++K) {
      if (K)
        Out += ", ";
      appendItem(Out, I.Children[K], Opts);
    }
    Out += ']';
    break;
  case MajorType::Map:
    Out += '{';
    for (std::size_t K = 0; K + 1 < I.Children.size(); K += 2) {
      if (K)
        Out += ", ";
      appendItem(Out, I.Children[K], Opts);
      Out += ": ";
      appendItem(Out, I.Children[K + 1], Opts);
    }
    Out += '}';
    break;
  case MajorType::Tagged: {
    Out += std::to_string(I.Argument);
    Out += '(';
    appendItem(Out, I.content(), Opts);
    Out += ')';
    if (Opts.Annotate) {
      const TagRegistry &R = Opts.Registry ? *Opts.Registry : tagRegistry();
      if (auto Name = R.nameFor(I.Argument))
        Out += "   / " + *Name + " /";
    }
    break;
  }
  case MajorType::Simple:
    if (I.FloatBytes != 0)
      appendFloat(Out, I);
    else if (I.Argument == SimpleFalse)
      Out += "false";
    else if (I.Argument == SimpleTrue)
      Out += "true";
    else if (I.Argument == SimpleNull)
      Out += "null";
    else if (I.Argument == SimpleUndefined)
      Out += "undefined";
    else
      Out += "simple(" + std::to_string(I.Argument) + ")";
    break;
  }
}

} // namespace detail

inline std::string diagnostic(const Item &I,
                              const DiagnosticOptions &Opts = {}) {
  std::string Out;
  detail::appendItem(Out, I, Opts);
  return Out;
}

} // namespace nanbstr::cbor

#endif // NANBSTR_CBOR_DIAGNOSTIC_HPP
