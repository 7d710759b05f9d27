#ifndef NANBSTR_CBOR_TAGS_HPP
#define NANBSTR_CBOR_TAGS_HPP

// Process-wide tag-name registry. Only diagnostics consult it; encoding
// and decoding never depend on what is registered.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace nanbstr::cbor {

// Tag 102: IEEE 754 NaN bit pattern carried in a byte string.
inline constexpr uint64_t NanBstrTag = 102;
inline constexpr std::string_view NanBstrTagName = "nan-bstr";

class TagRegistry {
public:
  // Later registrations of the same tag replace the name.
  void insert(uint64_t Tag, std::string_view Name) {
    std::lock_guard<std::mutex> Lock(Mu);
    Names[Tag] = std::string(Name);
  }

  std::optional<std::string> nameFor(uint64_t Tag) const {
    std::lock_guard<std::mutex> Lock(Mu);
    auto It = Names.find(Tag);
    if (It == Names.end())
      return std::nullopt;
    return It->second;
  }

  std::optional<uint64_t> tagFor(std::string_view Name) const {
    std::lock_guard<std::mutex> Lock(Mu);
    for (const auto &[Tag, N] : Names)
      if (N == Name)
        return Tag;
    return std::nullopt;
  }

  bool contains(uint64_t Tag) const {
    std::lock_guard<std::mutex> Lock(Mu);
    return Names.count(Tag) != 0;
  }

private:
  mutable std::mutex Mu;
  std::map<uint64_t, std::string> Names;
};

inline TagRegistry &tagRegistry() {
  static TagRegistry Registry;
  return Registry;
}

inline void registerNanBstrTags(TagRegistry &Registry = tagRegistry()) {
  Registry.insert(NanBstrTag, NanBstrTagName);
}

} // namespace nanbstr::cbor

#endif // NANBSTR_CBOR_TAGS_HPP
