// Scalar.hpp
// Which types display as a single value, and how their text is produced
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Inspect/Export.hpp>

#include <fmt/format.h>

#include <chrono>
#include <complex>
#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace NGIN::Inspect
{

  // Customization point: specialize for value types that should display as a
  // single line of text instead of being expanded (fixed-point, money, ...).
  //
  //   template <> struct ScalarFormatter<Money> {
  //     static constexpr bool Quoted = false;
  //     static std::string Format(const Money &m);
  //   };
  template <class T, class = void>
  struct ScalarFormatter;

  template <class T>
  concept ScalarType = requires(const T &v) {
    { ScalarFormatter<T>::Format(v) } -> std::convertible_to<std::string>;
  };

  namespace detail
  {
    template <class T>
    inline constexpr bool is_char_v = std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                                      std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
                                      std::is_same_v<T, char32_t>;

    // UTF-8 bytes of one code point; surrogates and out-of-range values
    // become U+FFFD.
    NGIN_INSPECT_API std::string EncodeUtf8(char32_t codePoint);
  } // namespace detail

  template <>
  struct ScalarFormatter<bool>
  {
    static constexpr bool Quoted = false;
    static std::string Format(bool v) { return v ? "true" : "false"; }
  };

  template <class T>
  struct ScalarFormatter<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> && !detail::is_char_v<T>>>
  {
    static constexpr bool Quoted = false;
    static std::string Format(T v)
    {
      if constexpr (sizeof(T) == 1)
        return fmt::format("{}", static_cast<int>(v));
      else
        return fmt::format("{}", v);
    }
  };

  template <class T>
  struct ScalarFormatter<T, std::enable_if_t<std::is_floating_point_v<T>>>
  {
    static constexpr bool Quoted = false;
    static std::string Format(T v) { return fmt::format("{}", v); }
  };

  template <>
  struct ScalarFormatter<char>
  {
    static constexpr bool Quoted = true;
    static std::string Format(char v) { return std::string(1, v); }
  };

  // Wide and Unicode character types display as one UTF-8 encoded character.
  template <class T>
  struct ScalarFormatter<T, std::enable_if_t<detail::is_char_v<T> && !std::is_same_v<T, char>>>
  {
    static constexpr bool Quoted = true;
    static std::string Format(T v) { return detail::EncodeUtf8(static_cast<char32_t>(v)); }
  };

  template <>
  struct ScalarFormatter<std::string>
  {
    static constexpr bool Quoted = true;
    static std::string Format(const std::string &v) { return v; }
  };

  template <>
  struct ScalarFormatter<std::string_view>
  {
    static constexpr bool Quoted = true;
    static std::string Format(std::string_view v) { return std::string{v}; }
  };

  template <>
  struct ScalarFormatter<const char *>
  {
    static constexpr bool Quoted = true;
    static std::string Format(const char *v) { return v ? std::string{v} : std::string{"null"}; }
  };

  template <>
  struct ScalarFormatter<char *> : ScalarFormatter<const char *>
  {
  };

  // String literals and fixed char buffers, up to the first NUL.
  template <std::size_t N>
  struct ScalarFormatter<char[N]>
  {
    static constexpr bool Quoted = true;
    static std::string Format(const char (&v)[N])
    {
      const std::string_view text{v, N};
      return std::string{text.substr(0, text.find('\0'))};
    }
  };

  template <class F>
  struct ScalarFormatter<std::complex<F>>
  {
    static constexpr bool Quoted = false;
    static std::string Format(const std::complex<F> &v) { return fmt::format("({}{:+}i)", v.real(), v.imag()); }
  };

  template <>
  struct ScalarFormatter<std::chrono::year_month_day>
  {
    static constexpr bool Quoted = false;
    static std::string Format(const std::chrono::year_month_day &v)
    {
      return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(v.year()), static_cast<unsigned>(v.month()),
                         static_cast<unsigned>(v.day()));
    }
  };

  template <class T>
  struct ScalarFormatter<T, std::enable_if_t<std::is_enum_v<T>>>
  {
    static constexpr bool Quoted = false;
    static std::string Format(T v) { return fmt::format("{}", std::to_underlying(v)); }
  };

  template <>
  struct ScalarFormatter<std::nullptr_t>
  {
    static constexpr bool Quoted = false;
    static std::string Format(std::nullptr_t) { return "null"; }
  };

  template <>
  struct ScalarFormatter<std::monostate>
  {
    static constexpr bool Quoted = false;
    static std::string Format(std::monostate) { return "null"; }
  };

  // Unquoted string form of a scalar value.
  template <ScalarType T>
  std::string ScalarText(const T &value)
  {
    return std::string{ScalarFormatter<T>::Format(value)};
  }

  // Formatters without a Quoted member display unquoted.
  template <ScalarType T>
  constexpr bool IsQuotedScalar() noexcept
  {
    if constexpr (requires { ScalarFormatter<T>::Quoted; })
      return ScalarFormatter<T>::Quoted;
    else
      return false;
  }

  namespace detail
  {
    // Double-quotes text for display.
    NGIN_INSPECT_API std::string Quote(std::string_view text);
    // A quoted run of '*' as long as `text` has characters.
    NGIN_INSPECT_API std::string Mask(std::string_view text);
  } // namespace detail

} // namespace NGIN::Inspect
