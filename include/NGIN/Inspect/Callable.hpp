// Callable.hpp
// Callable values as the inspector sees them: methods bound to a receiver and
// partially applied calls.
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Scalar.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace NGIN::Inspect
{

  // Stands in for a bound argument that has no scalar text.
  inline constexpr std::string_view kComplexText = "(complex)";

  // A registered member function as seen on an instance. Parameter names
  // exclude the receiver.
  class NGIN_INSPECT_API BoundMethod
  {
  public:
    BoundMethod() = default;
    BoundMethod(std::string_view name, std::vector<std::string_view> parameters)
        : m_name(name), m_parameters(std::move(parameters))
    {
    }

    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    [[nodiscard]] const std::vector<std::string_view> &Parameters() const noexcept { return m_parameters; }

    // "a, b, c"
    [[nodiscard]] std::string Signature() const;

  private:
    std::string_view m_name{};
    std::vector<std::string_view> m_parameters{};
  };

  // A callable with some arguments bound ahead of time. Only the display text
  // of bound arguments is kept: scalar-eligible values keep their text, any
  // other value is recorded as complex.
  class NGIN_INSPECT_API Partial
  {
  public:
    struct Argument
    {
      std::string name;
      bool bound{false};
      std::optional<std::string> text{};
    };

    Partial() = default;
    Partial(std::string target, std::vector<std::string> parameters)
        : m_target(std::move(target)), m_parameters(std::move(parameters))
    {
    }

    // Binds leading parameters positionally.
    template <class... A>
    [[nodiscard]] static Partial Bind(std::string target, std::vector<std::string> parameters, A &&...positional)
    {
      Partial p{std::move(target), std::move(parameters)};
      (p.m_positional.push_back(BoundText(positional)), ...);
      return p;
    }

    // Binds a parameter by name. A positional binding of the same parameter
    // takes precedence.
    template <class V>
    Partial &With(std::string name, const V &value)
    {
      m_keywords.emplace_back(std::move(name), BoundText(value));
      return *this;
    }

    [[nodiscard]] std::string_view Target() const noexcept { return m_target; }
    [[nodiscard]] NGIN::UIntSize ParameterCount() const noexcept { return m_parameters.size(); }
    [[nodiscard]] NGIN::UIntSize PositionalCount() const noexcept { return m_positional.size(); }

    // Formal parameters of the target in order, with their binding resolved.
    [[nodiscard]] std::vector<Argument> Arguments() const;

    // "<name>(...) -> <target>"
    [[nodiscard]] std::string Title(std::string_view name) const;
    // "a=1, b=(complex), c"
    [[nodiscard]] std::string Signature() const;

  private:
    // Scalar text of `value` after the same indirections the classifier
    // follows, or nullopt for anything that is not a scalar. Defined in
    // Shape.hpp.
    template <class V>
    static std::optional<std::string> BoundText(const V &value);

    std::string m_target{};
    std::vector<std::string> m_parameters{};
    std::vector<std::optional<std::string>> m_positional{};
    std::vector<std::pair<std::string, std::optional<std::string>>> m_keywords{};
  };

} // namespace NGIN::Inspect
