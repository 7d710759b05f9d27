#ifndef NANBSTR_CORE_STATUS_HPP
#define NANBSTR_CORE_STATUS_HPP

#include <optional>
#include <utility>

namespace nanbstr {

// Outcome of every fallible operation. Failures are returned with the
// result, never thrown; there are no retries because validation is pure.
enum class Status {
  Ok,
  InvalidLength, // byte count is not 2, 4, 8 or 16
  NotANan,       // right length, but exponent/fraction fail the NaN test
  WrongShape,    // tagged content is not a byte string
  WrongTag,      // tagged with something other than 102
  Truncated,     // CBOR input ends inside an item
  Malformed,     // reserved or indefinite-length encoding
  NonCanonical,  // argument not in its shortest form
  TrailingData,  // bytes left after the top-level item
  TooDeep,       // nesting exceeds the decoder's limit
};

inline const char *statusName(Status S) {
  switch (S) {
  case Status::Ok:            return "ok";
  case Status::InvalidLength: return "invalid NaN length";
  case Status::NotANan:       return "not a NaN bit pattern";
  case Status::WrongShape:    return "wrong shape";
  case Status::WrongTag:      return "wrong tag";
  case Status::Truncated:     return "truncated CBOR";
  case Status::Malformed:     return "malformed CBOR";
  case Status::NonCanonical:  return "non-canonical CBOR";
  case Status::TrailingData:  return "trailing data after CBOR item";
  case Status::TooDeep:       return "CBOR nesting too deep";
  }
  return "???";
}

// Either a value or the Status explaining why there is none. A failed
// Result never carries a partially built value.
template <typename T> class Result {
public:
  Result(T Val) : Value(std::move(Val)), Code(Status::Ok) {}
  Result(Status S) : Code(S) {}

  bool ok() const { return Code == Status::Ok && Value.has_value(); }
  explicit operator bool() const { return ok(); }
  Status status() const { return Code; }

  // Precondition: ok().
  const T &value() const & { return *Value; }
  T &value() & { return *Value; }
  T &&value() && { return std::move(*Value); }

  const T &operator*() const & { return *Value; }
  T &&operator*() && { return std::move(*Value); }
  const T *operator->() const { return &*Value; }

private:
  std::optional<T> Value;
  Status Code;
};

} // namespace nanbstr

#endif // NANBSTR_CORE_STATUS_HPP
