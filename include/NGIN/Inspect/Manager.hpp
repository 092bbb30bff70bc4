// Manager.hpp
// Traversal engine: budgets, cycle detection and tree assembly
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Node.hpp>
#include <NGIN/Inspect/Shape.hpp>
#include <NGIN/Inspect/TypeBuilder.hpp>
#include <NGIN/Inspect/Types.hpp>
#include <NGIN/Inspect/Value.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <type_traits>

namespace NGIN::Inspect
{

  struct InspectOptions
  {
    // Generations of children expanded below the root.
    NGIN::UInt32 maxDepth{2};
    // Entries expanded per Mapping, Sequence or LazyCollection.
    NGIN::UInt32 maxItems{5};
  };

  class NGIN_INSPECT_API Manager
  {
  public:
    Manager() = default;
    explicit Manager(InspectOptions options) : m_options(options) {}

    [[nodiscard]] const InspectOptions &Options() const noexcept { return m_options; }

    // Each call runs a self-contained traversal with its own visited-set.
    [[nodiscard]] ExpectedNode InspectValue(std::string_view name, const ValueRef &value) const;

    template <class T>
    [[nodiscard]] ExpectedNode Inspect(std::string_view name, const T &value) const
    {
      if constexpr (std::is_same_v<T, ValueRef>)
        return InspectValue(name, value);
      else
        return InspectValue(name, MakeValueRef(value));
    }

    // Inspect, project and render with the named style.
    [[nodiscard]] std::expected<std::string, Error> FormatValue(std::string_view name, const ValueRef &value,
                                                                std::string_view styleName) const;

    template <class T>
    [[nodiscard]] std::expected<std::string, Error> Format(std::string_view name, const T &value,
                                                           std::string_view styleName = "text") const
    {
      if constexpr (std::is_same_v<T, ValueRef>)
        return FormatValue(name, value, styleName);
      else
        return FormatValue(name, MakeValueRef(value), styleName);
    }

  private:
    InspectOptions m_options{};
  };

  template <class T>
  [[nodiscard]] ExpectedNode Inspect(std::string_view name, const T &value, NGIN::UInt32 maxDepth = 2,
                                     NGIN::UInt32 maxItems = 5)
  {
    return Manager{InspectOptions{maxDepth, maxItems}}.Inspect(name, value);
  }

} // namespace NGIN::Inspect
