// NameUtils.hpp
// Member identifiers from pointer-to-member constants, and name predicates used
// when deciding what an inspection may show.
#pragma once

#include <NGIN/Primitives.hpp>

#include <string_view>

namespace NGIN::Inspect::detail {

// Works for data members and member functions alike: the compiler signature
// embeds "&Class::member" for either kind of pointer.
template<auto MemberPtr>
consteval std::string_view MemberNameFromPretty() noexcept {
#if defined(_MSC_VER)
  constexpr std::string_view sig = __FUNCSIG__;
  constexpr std::string_view key = "< &";
  constexpr std::string_view close = " >";
#elif defined(__clang__)
  constexpr std::string_view sig = __PRETTY_FUNCTION__;
  constexpr std::string_view key = "[MemberPtr = &";
  constexpr std::string_view close = "]";
#elif defined(__GNUC__)
  constexpr std::string_view sig = __PRETTY_FUNCTION__;
  constexpr std::string_view key = "[with auto MemberPtr = &";
  constexpr std::string_view close = "]";
#else
  constexpr std::string_view sig = {};
  constexpr std::string_view key = "&";
  constexpr std::string_view close = "]";
#endif
  auto kpos = sig.find(key);
  if (kpos == std::string_view::npos) return {};
  auto start = kpos + key.size();
  auto end = sig.find(close, start);
  // GCC appends typedef expansions after ';' inside the brackets
  if (auto semi = sig.find(';', start); semi < end) end = semi;
  if (end == std::string_view::npos || end <= start) return {};
  auto full = sig.substr(start, end - start); // Class::member
  auto dc = full.rfind("::");
  if (dc == std::string_view::npos) return full;
  return full.substr(dc + 2);
}

// Leading underscore marks a member as private to the inspector.
constexpr bool IsPrivateName(std::string_view name) noexcept {
  return !name.empty() && name.front() == '_';
}

constexpr char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Case-insensitive test for "password" anywhere in a field name.
constexpr bool IsSecretName(std::string_view name) noexcept {
  constexpr std::string_view needle = "password";
  if (name.size() < needle.size()) return false;
  for (std::size_t i = 0; i + needle.size() <= name.size(); ++i) {
    bool match = true;
    for (std::size_t j = 0; j < needle.size(); ++j) {
      if (AsciiLower(name[i + j]) != needle[j]) { match = false; break; }
    }
    if (match) return true;
  }
  return false;
}

// Number of characters in UTF-8 text (continuation bytes are not counted).
constexpr NGIN::UIntSize CodePointCount(std::string_view text) noexcept {
  NGIN::UIntSize count = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0u) != 0x80u) ++count;
  }
  return count;
}

} // namespace NGIN::Inspect::detail
