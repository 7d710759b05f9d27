#ifndef NANBSTR_CBOR_ITEM_HPP
#define NANBSTR_CBOR_ITEM_HPP

// A decoded or to-be-encoded CBOR data item (RFC 8949).
//
// One flat struct covers every major type:
//   Unsigned / Negative  Argument holds n (value is n or -1-n)
//   ByteString / Text    Payload holds the content bytes
//   Array                Children holds the elements
//   Map                  Children holds key, value, key, value, ...
//   Tagged               Argument holds the tag, Children[0] the content
//   Simple               Argument holds the simple value, or the raw
//                        float bits when FloatBytes is 2, 4 or 8

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace nanbstr::cbor {

enum class MajorType : uint8_t {
  Unsigned = 0,
  Negative = 1,
  ByteString = 2,
  TextString = 3,
  Array = 4,
  Map = 5,
  Tagged = 6,
  Simple = 7,
};

inline constexpr uint64_t SimpleFalse = 20;
inline constexpr uint64_t SimpleTrue = 21;
inline constexpr uint64_t SimpleNull = 22;
inline constexpr uint64_t SimpleUndefined = 23;

struct Item {
  MajorType Type = MajorType::Simple;
  uint64_t Argument = SimpleUndefined;
  int FloatBytes = 0;
  std::vector<uint8_t> Payload;
  std::vector<Item> Children;

  bool isByteString() const { return Type == MajorType::ByteString; }
  bool isTagged() const { return Type == MajorType::Tagged; }
  bool isFloat() const { return Type == MajorType::Simple && FloatBytes != 0; }

  uint64_t tag() const { return Argument; }

  // The tagged content. A tag item built without exactly one child has
  // none; it reads as undefined.
  const Item &content() const;

  friend bool operator==(const Item &, const Item &) = default;
};

inline const Item &Item::content() const {
  static const Item Undefined;
  return Children.size() == 1 ? Children.front() : Undefined;
}

inline Item unsignedInt(uint64_t N) {
  Item I;
  I.Type = MajorType::Unsigned;
  I.Argument = N;
  return I;
}

// Encodes the integer -1 - N.
inline Item negativeInt(uint64_t N) {
  Item I;
  I.Type = MajorType::Negative;
  I.Argument = N;
  return I;
}

inline Item byteString(std::span<const uint8_t> Bytes) {
  Item I;
  I.Type = MajorType::ByteString;
  I.Argument = 0;
  I.Payload.assign(Bytes.begin(), Bytes.end());
  return I;
}

inline Item textString(std::string_view Text) {
  Item I;
  I.Type = MajorType::TextString;
  I.Argument = 0;
  I.Payload.assign(Text.begin(), Text.end());
  return I;
}

inline Item array(std::vector<Item> Elements) {
  Item I;
  I.Type = MajorType::Array;
  I.Argument = 0;
  I.Children = std::move(Elements);
  return I;
}

// Entries are key/value pairs; ordering is kept as given.
inline Item map(std::vector<std::pair<Item, Item>> Entries) {
  Item I;
  I.Type = MajorType::Map;
  I.Argument = 0;
  I.Children.reserve(Entries.size() * 2);
  for (auto &[K, V] : Entries) {
    I.Children.push_back(std::move(K));
    I.Children.push_back(std::move(V));
  }
  return I;
}

inline Item tagged(uint64_t Tag, Item Content) {
  Item I;
  I.Type = MajorType::Tagged;
  I.Argument = Tag;
  I.Children.push_back(std::move(Content));
  return I;
}

inline Item simple(uint64_t Value) {
  Item I;
  I.Type = MajorType::Simple;
  I.Argument = Value;
  return I;
}

inline Item boolean(bool B) { return simple(B ? SimpleTrue : SimpleFalse); }
inline Item null() { return simple(SimpleNull); }

// A float item carrying its raw IEEE 754 bits at 2, 4 or 8 bytes.
inline Item floatBits(uint64_t Bits, int Bytes) {
  Item I;
  I.Type = MajorType::Simple;
  I.Argument = Bits;
  I.FloatBytes = Bytes;
  return I;
}

} // namespace nanbstr::cbor

#endif // NANBSTR_CBOR_ITEM_HPP
