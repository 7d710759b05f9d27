#ifndef NANBSTR_CBOR_DECODER_HPP
#define NANBSTR_CBOR_DECODER_HPP

// Strict CBOR decoder. Accepts exactly one definite-length item in
// deterministic form and nothing after it. Anything the encoder would
// not have produced is rejected rather than repaired.

#include <cstddef>
#include <cstdint>
#include <span>

#include "nanbstr/cbor/item.hpp"
#include "nanbstr/core/bits.hpp"
#include "nanbstr/core/status.hpp"

namespace nanbstr::cbor {

struct DecodeOptions {
  // Arrays, maps and tags nested deeper than this fail with TooDeep.
  int MaxDepth = 64;
  // Reject arguments that have a shorter encoding.
  bool RequireShortestForm = true;
};

namespace detail {

class Reader {
public:
  Reader(std::span<const uint8_t> Data, const DecodeOptions &Opts)
      : Data(Data), Opts(Opts) {}

  bool atEnd() const { return Pos == Data.size(); }

  Status readItem(Item &Out, int Depth) {
    if (Depth > Opts.MaxDepth)
      return Status::TooDeep;
    if (Pos >= Data.size())
      return Status::Truncated;

    const uint8_t Initial = Data[Pos++];
    const auto Type = static_cast<MajorType>(Initial >> 5);
    const uint8_t Ai = Initial & 0x1F;

    if (Type == MajorType::Simple)
      return readSimple(Out, Ai);

    uint64_t Arg = 0;
    if (Status S = readArgument(Ai, Arg); S != Status::Ok)
      return S;

    Out = Item{};
    Out.Type = Type;
    Out.Argument = Arg;

    switch (Type) {
    case MajorType::Unsigned:
    case MajorType::Negative:
      return Status::Ok;
    case MajorType::ByteString:
    case MajorType::TextString:
      Out.Argument = 0;
      if (Arg > Data.size() - Pos)
        return Status::Truncated;
      {
        auto Content = Data.subspan(Pos, static_cast<std::size_t>(Arg));
        Out.Payload.assign(Content.begin(), Content.end());
        Pos += Content.size();
      }
      return Status::Ok;
    case MajorType::Array:
    case MajorType::Map: {
      Out.Argument = 0;
      uint64_t Count = Type == MajorType::Map ? Arg * 2 : Arg;
      // Every item takes at least one byte.
      if (Count > Data.size() - Pos)
        return Status::Truncated;
      Out.Children.resize(static_cast<std::size_t>(Count));
      for (Item &C : Out.Children)
        if (Status S = readItem(C, Depth + 1); S != Status::Ok)
          return S;
      return Status::Ok;
    }
    case MajorType::Tagged:
      Out.Children.resize(1);
      return readItem(Out.Children[0], Depth + 1);
    case MajorType::Simple:
      break;
    }
    return Status::Malformed;
  }

private:
  Status readArgument(uint8_t Ai, uint64_t &Arg) {
    if (Ai < 24) {
      Arg = Ai;
      return Status::Ok;
    }
    if (Ai > 27) // 28-30 reserved, 31 indefinite length
      return Status::Malformed;
    const std::size_t Len = std::size_t{1} << (Ai - 24);
    if (Len > Data.size() - Pos)
      return Status::Truncated;
    Arg = loadBigEndian<uint64_t>(Data.data() + Pos, Len);
    Pos += Len;
    if (Opts.RequireShortestForm) {
      const uint64_t Floor = Len == 1 ? 24 : uint64_t{1} << (Len * 4);
      if (Arg < Floor)
        return Status::NonCanonical;
    }
    return Status::Ok;
  }

  Status readSimple(Item &Out, uint8_t Ai) {
    if (Ai < 24) {
      Out = simple(Ai);
      return Status::Ok;
    }
    if (Ai == 24) {
      if (Pos >= Data.size())
        return Status::Truncated;
      uint8_t V = Data[Pos++];
      if (V < 32) // two-byte forms of 0..31 are not well-formed
        return Status::Malformed;
      Out = simple(V);
      return Status::Ok;
    }
    if (Ai > 27)
      return Status::Malformed;
    const std::size_t Len = std::size_t{1} << (Ai - 24);
    if (Len > Data.size() - Pos)
      return Status::Truncated;
    Out = floatBits(loadBigEndian<uint64_t>(Data.data() + Pos, Len),
                    static_cast<int>(Len));
    Pos += Len;
    return Status::Ok;
  }

  std::span<const uint8_t> Data;
  const DecodeOptions &Opts;
  std::size_t Pos = 0;
};

} // namespace detail

inline Result<Item> decode(std::span<const uint8_t> Data,
                           const DecodeOptions &Opts = {}) {
  detail::Reader R(Data, Opts);
  Item Out;
  if (Status S = R.readItem(Out, 0); S != Status::Ok)
    return S;
  if (!R.atEnd())
    return Status::TrailingData;
  return Out;
}

} // namespace nanbstr::cbor

#endif // NANBSTR_CBOR_DECODER_HPP
