#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "nanbstr/nanbstr.hpp"

using namespace nanbstr;
using Bytes = std::vector<uint8_t>;

TEST_SUITE("cbor: encoder") {

  TEST_CASE("arguments use the shortest head") {
    CHECK(cbor::encode(cbor::unsignedInt(0)) == Bytes{0x00});
    CHECK(cbor::encode(cbor::unsignedInt(23)) == Bytes{0x17});
    CHECK(cbor::encode(cbor::unsignedInt(24)) == Bytes{0x18, 0x18});
    CHECK(cbor::encode(cbor::unsignedInt(255)) == Bytes{0x18, 0xFF});
    CHECK(cbor::encode(cbor::unsignedInt(256)) == Bytes{0x19, 0x01, 0x00});
    CHECK(cbor::encode(cbor::unsignedInt(65536)) ==
          Bytes{0x1A, 0x00, 0x01, 0x00, 0x00});
    CHECK(cbor::encode(cbor::unsignedInt(uint64_t{1} << 32)) ==
          Bytes{0x1B, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
    CHECK(cbor::encode(cbor::negativeInt(0)) == Bytes{0x20});
  }

  TEST_CASE("containers and tags") {
    auto Item = cbor::array({cbor::unsignedInt(1), cbor::textString("a"),
                             cbor::tagged(102, cbor::byteString(Bytes{0x7E,
                                                                     0x00}))});
    CHECK(cbor::encode(Item) ==
          Bytes{0x83, 0x01, 0x61, 'a', 0xD8, 0x66, 0x42, 0x7E, 0x00});
    CHECK(cbor::encode(cbor::map({{cbor::unsignedInt(1), cbor::boolean(true)}})) ==
          Bytes{0xA1, 0x01, 0xF5});
    CHECK(cbor::encode(cbor::null()) == Bytes{0xF6});
  }

  TEST_CASE("floats keep their width") {
    CHECK(cbor::encode(cbor::floatBits(0x7E00, 2)) == Bytes{0xF9, 0x7E, 0x00});
    CHECK(cbor::encode(cbor::floatBits(0x7FC00001, 4)) ==
          Bytes{0xFA, 0x7F, 0xC0, 0x00, 0x01});
  }
}

TEST_SUITE("cbor: decoder") {

  TEST_CASE("decode inverts encode") {
    auto Item = cbor::map(
        {{cbor::textString("k"),
          cbor::array({cbor::negativeInt(9), cbor::floatBits(0x3E00, 2),
                       cbor::simple(cbor::SimpleUndefined),
                       cbor::tagged(1, cbor::unsignedInt(1000000))})}});
    auto Back = cbor::decode(cbor::encode(Item));
    REQUIRE(Back.ok());
    CHECK(*Back == Item);
  }

  TEST_CASE("float items decode as raw bits") {
    auto F = cbor::decode(Bytes{0xF9, 0x7E, 0x00});
    REQUIRE(F.ok());
    CHECK(F->isFloat());
    CHECK(F->FloatBytes == 2);
    CHECK(F->Argument == 0x7E00);
  }

  TEST_CASE("truncated input") {
    CHECK(cbor::decode(Bytes{}).status() == Status::Truncated);
    CHECK(cbor::decode(Bytes{0xD8}).status() == Status::Truncated);
    CHECK(cbor::decode(Bytes{0xD8, 0x66, 0x42, 0x7E}).status() ==
          Status::Truncated);
    CHECK(cbor::decode(Bytes{0x82, 0x01}).status() == Status::Truncated);
    CHECK(cbor::decode(Bytes{0xFA, 0x7F, 0xC0}).status() == Status::Truncated);
  }

  TEST_CASE("non-shortest arguments") {
    CHECK(cbor::decode(Bytes{0x18, 0x05}).status() == Status::NonCanonical);
    CHECK(cbor::decode(Bytes{0xD9, 0x00, 0x66, 0x42, 0x7E, 0x00}).status() ==
          Status::NonCanonical);
    CHECK(cbor::decode(Bytes{0x59, 0x00, 0x02, 0x7E, 0x00}).status() ==
          Status::NonCanonical);

    cbor::DecodeOptions Lenient;
    Lenient.RequireShortestForm = false;
    auto I = cbor::decode(Bytes{0x18, 0x05}, Lenient);
    REQUIRE(I.ok());
    CHECK(I->Argument == 5);
  }

  TEST_CASE("indefinite lengths and reserved values") {
    CHECK(cbor::decode(Bytes{0x5F, 0x42, 0x7E, 0x00, 0xFF}).status() ==
          Status::Malformed);
    CHECK(cbor::decode(Bytes{0x1C}).status() == Status::Malformed);
    CHECK(cbor::decode(Bytes{0xF8, 0x10}).status() == Status::Malformed);
  }

  TEST_CASE("trailing data") {
    CHECK(cbor::decode(Bytes{0xD8, 0x66, 0x42, 0x7E, 0x00, 0x00}).status() ==
          Status::TrailingData);
  }

  TEST_CASE("nesting limit") {
    Bytes Deep(100, 0x81);
    Deep.push_back(0x00);
    CHECK(cbor::decode(Deep).status() == Status::TooDeep);

    cbor::DecodeOptions Roomy;
    Roomy.MaxDepth = 200;
    CHECK(cbor::decode(Deep, Roomy).ok());
  }
}

TEST_SUITE("cbor: diagnostic notation") {

  TEST_CASE("scalars and containers") {
    auto Item = cbor::array(
        {cbor::unsignedInt(1), cbor::negativeInt(1), cbor::textString("a\"b"),
         cbor::byteString(Bytes{0x00, 0xFF}),
         cbor::map({{cbor::unsignedInt(1), cbor::boolean(true)}}),
         cbor::null(), cbor::tagged(102, cbor::byteString(Bytes{0x7E, 0x00}))});
    CHECK(cbor::diagnostic(Item) ==
          "[1, -2, \"a\\\"b\", h'00ff', {1: true}, null, 102(h'7e00')]");
  }

  TEST_CASE("control characters are escaped") {
    CHECK(cbor::diagnostic(cbor::textString("a\nb\x01")) ==
          "\"a\\u000ab\\u0001\"");
    CHECK(cbor::diagnostic(cbor::textString("\x1f")) == "\"\\u001f\"");
  }

  TEST_CASE("extreme negative integer") {
    CHECK(cbor::diagnostic(cbor::negativeInt(
              std::numeric_limits<uint64_t>::max())) ==
          "-18446744073709551616");
  }

  TEST_CASE("floats") {
    CHECK(cbor::diagnostic(cbor::floatBits(0x3E00, 2)) == "1.5");
    CHECK(cbor::diagnostic(cbor::floatBits(0x7E00, 2)) == "NaN");
    CHECK(cbor::diagnostic(cbor::floatBits(0xFF800000, 4)) == "-Infinity");
    CHECK(cbor::diagnostic(cbor::floatBits(0x3FF0000000000000ull, 8)) ==
          "1.0");
  }

  TEST_CASE("annotation uses the registry") {
    cbor::TagRegistry Local;
    cbor::registerNanBstrTags(Local);
    cbor::DiagnosticOptions Opts;
    Opts.Annotate = true;
    Opts.Registry = &Local;

    auto Item = cbor::tagged(102, cbor::byteString(Bytes{0x7E, 0x00}));
    CHECK(cbor::diagnostic(Item, Opts) == "102(h'7e00')   / nan-bstr /");
    CHECK(cbor::diagnostic(cbor::tagged(7, cbor::null()), Opts) == "7(null)");
    CHECK(cbor::diagnostic(Item) == "102(h'7e00')");
  }
}

TEST_SUITE("cbor: tag registry") {

  TEST_CASE("lookup both ways") {
    cbor::TagRegistry R;
    CHECK_FALSE(R.contains(102));
    cbor::registerNanBstrTags(R);
    CHECK(R.contains(102));
    CHECK(R.nameFor(102).value() == "nan-bstr");
    CHECK(R.tagFor("nan-bstr").value() == 102);
    CHECK_FALSE(R.nameFor(103).has_value());
  }

  TEST_CASE("global registry") {
    cbor::registerNanBstrTags();
    CHECK(cbor::tagRegistry().nameFor(cbor::NanBstrTag).value() ==
          "nan-bstr");
  }
}

TEST_SUITE("NanBstr: tagged CBOR") {

  TEST_CASE("binary16 quiet NaN round-trips through tag 102") {
    auto N = *NanBstr::fromBinary16Bits(0x7E00);
    auto Item = N.taggedCbor();
    CHECK(Item.tag() == 102);
    CHECK(cbor::diagnostic(Item) == "102(h'7e00')");
    CHECK(N.toCborData() == Bytes{0xD8, 0x66, 0x42, 0x7E, 0x00});

    auto Back = NanBstr::fromCborData(N.toCborData());
    REQUIRE(Back.ok());
    CHECK(*Back == N);
    CHECK(Back->bytes()[0] == 0x7E);
    CHECK(Back->bytes()[1] == 0x00);
  }

  TEST_CASE("diagnostics for the reference encodings") {
    CHECK(cbor::diagnostic(
              NanBstr::fromBinary32Bits(0x7FC00001)->taggedCbor()) ==
          "102(h'7fc00001')");
    CHECK(cbor::diagnostic(
              NanBstr::fromBinary64Bits(0xFFF0000000000001ull)->taggedCbor()) ==
          "102(h'fff0000000000001')");
    CHECK(cbor::diagnostic(
              NanBstr::fromBinary64Bits(0x7FF8000000000123ull)->taggedCbor()) ==
          "102(h'7ff8000000000123')");
    CHECK(cbor::diagnostic(
              NanBstr::fromBinary128Words(0x7FFF800000000000ull, 1)
                  ->taggedCbor()) ==
          "102(h'7fff8000000000000000000000000001')");
  }

  TEST_CASE("every width round-trips byte-for-byte") {
    for (auto N : {*NanBstr::fromBinary16Bits(0xFC01),
                   *NanBstr::fromBinary32Bits(0xFF800001),
                   *NanBstr::fromBinary64Bits(0x7FF0000000000001ull),
                   *NanBstr::fromBinary128Words(0xFFFF7FFFFFFFFFFFull,
                                                0xFFFFFFFFFFFFFFFFull)}) {
      CAPTURE(N.toString());
      auto Back = NanBstr::fromTaggedCbor(N.taggedCbor());
      REQUIRE(Back.ok());
      CHECK(*Back == N);
      auto Wire = NanBstr::fromCborData(N.toCborData());
      REQUIRE(Wire.ok());
      CHECK(*Wire == N);
    }
  }

  TEST_CASE("untagged content") {
    auto N = *NanBstr::fromBinary32Bits(0x7FC00001);
    auto Content = N.untaggedCbor();
    CHECK(Content.isByteString());
    CHECK(*NanBstr::fromUntaggedCbor(Content) == N);
    CHECK(NanBstr::fromUntaggedCbor(cbor::textString("nan")).status() ==
          Status::WrongShape);
    CHECK(NanBstr::fromUntaggedCbor(cbor::unsignedInt(0x7FC00001)).status() ==
          Status::WrongShape);
  }

  TEST_CASE("decode re-validates the wire") {
    // 102(h'7c00'): binary16 +Inf
    CHECK(NanBstr::fromCborData(Bytes{0xD8, 0x66, 0x42, 0x7C, 0x00}).status() ==
          Status::NotANan);
    // 102(h'7fc000'): three bytes
    CHECK(NanBstr::fromCborData(Bytes{0xD8, 0x66, 0x43, 0x7F, 0xC0, 0x00})
              .status() == Status::InvalidLength);
    // 102(h'7ff0000000000000'): binary64 +Inf
    CHECK(NanBstr::fromCborData(Bytes{0xD8, 0x66, 0x48, 0x7F, 0xF0, 0, 0, 0, 0,
                                      0, 0})
              .status() == Status::NotANan);
  }

  TEST_CASE("decode checks tag and shape") {
    // 102("hi")
    CHECK(NanBstr::fromCborData(Bytes{0xD8, 0x66, 0x62, 'h', 'i'}).status() ==
          Status::WrongShape);
    // 103(h'7e00')
    CHECK(NanBstr::fromCborData(Bytes{0xD8, 0x67, 0x42, 0x7E, 0x00}).status() ==
          Status::WrongTag);
    // h'7e00' without a tag
    CHECK(NanBstr::fromCborData(Bytes{0x42, 0x7E, 0x00}).status() ==
          Status::WrongShape);
    // 102(0x7e00 as a half float)
    CHECK(NanBstr::fromCborData(Bytes{0xD8, 0x66, 0xF9, 0x7E, 0x00}).status() ==
          Status::WrongShape);
  }

  TEST_CASE("tag item without exactly one child") {
    cbor::Item Empty;
    Empty.Type = cbor::MajorType::Tagged;
    Empty.Argument = 102;
    CHECK(NanBstr::fromTaggedCbor(Empty).status() == Status::WrongShape);

    cbor::Item Two = Empty;
    Two.Children = {cbor::byteString(Bytes{0x7E, 0x00}),
                    cbor::byteString(Bytes{0x7E, 0x00})};
    CHECK(NanBstr::fromTaggedCbor(Two).status() == Status::WrongShape);

    // Encoding and printing treat the missing content as undefined.
    CHECK(cbor::encode(Empty) == Bytes{0xD8, 0x66, 0xF7});
    CHECK(cbor::diagnostic(Empty) == "102(undefined)");
  }

  TEST_CASE("container errors propagate") {
    CHECK(NanBstr::fromCborData(Bytes{0xD8, 0x66, 0x42, 0x7E}).status() ==
          Status::Truncated);
    CHECK(NanBstr::fromCborData(Bytes{0xD8, 0x66, 0x42, 0x7E, 0x00, 0x00})
              .status() == Status::TrailingData);
    CHECK(NanBstr::fromCborData(Bytes{0xD9, 0x00, 0x66, 0x42, 0x7E, 0x00})
              .status() == Status::NonCanonical);
  }
}
