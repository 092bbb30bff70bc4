// Dynamic.hpp
// Heterogeneous, reference-counted values: insertion-ordered maps and lists
// that may refer to themselves. Inspection input only: unlike the JSON
// contexts produced by Project(), these may contain cycles.
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Inspect/Export.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace NGIN::Inspect::Dynamic
{

  class Map;
  class List;

  using MapPtr = std::shared_ptr<Map>;
  using ListPtr = std::shared_ptr<List>;

  class NGIN_INSPECT_API Value
  {
  public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, MapPtr, ListPtr>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : m_data(v) {}
    template <std::integral I>
    requires (!std::same_as<I, bool> && !std::same_as<I, char>)
    Value(I v) : m_data(static_cast<std::int64_t>(v))
    {
    }
    template <std::floating_point F>
    Value(F v) : m_data(static_cast<double>(v))
    {
    }
    Value(std::string v) : m_data(std::move(v)) {}
    Value(std::string_view v) : m_data(std::string{v}) {}
    Value(const char *v) : m_data(std::string{v}) {}
    Value(MapPtr v) : m_data(std::move(v)) {}
    Value(ListPtr v) : m_data(std::move(v)) {}

    [[nodiscard]] bool IsNull() const noexcept { return std::holds_alternative<std::monostate>(m_data); }
    [[nodiscard]] bool IsBool() const noexcept { return std::holds_alternative<bool>(m_data); }
    [[nodiscard]] bool IsInt() const noexcept { return std::holds_alternative<std::int64_t>(m_data); }
    [[nodiscard]] bool IsDouble() const noexcept { return std::holds_alternative<double>(m_data); }
    [[nodiscard]] bool IsString() const noexcept { return std::holds_alternative<std::string>(m_data); }
    [[nodiscard]] bool IsMap() const noexcept { return std::holds_alternative<MapPtr>(m_data); }
    [[nodiscard]] bool IsList() const noexcept { return std::holds_alternative<ListPtr>(m_data); }

    [[nodiscard]] bool AsBool() const { return std::get<bool>(m_data); }
    [[nodiscard]] std::int64_t AsInt() const { return std::get<std::int64_t>(m_data); }
    [[nodiscard]] double AsDouble() const { return std::get<double>(m_data); }
    [[nodiscard]] const std::string &AsString() const { return std::get<std::string>(m_data); }
    [[nodiscard]] const MapPtr &AsMap() const { return std::get<MapPtr>(m_data); }
    [[nodiscard]] const ListPtr &AsList() const { return std::get<ListPtr>(m_data); }

    [[nodiscard]] const Storage &Data() const noexcept { return m_data; }

  private:
    Storage m_data{};
  };

  // Unique keys, iteration in insertion order. Setting an existing key
  // replaces its value in place.
  class NGIN_INSPECT_API Map
  {
  public:
    using Entry = std::pair<std::string, Value>;

    Map() = default;
    Map(std::initializer_list<Entry> entries);

    Map &Set(std::string key, Value value);
    [[nodiscard]] const Value *Find(std::string_view key) const;
    [[nodiscard]] bool Contains(std::string_view key) const { return Find(key) != nullptr; }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_entries.empty(); }

    [[nodiscard]] const Entry &EntryAt(NGIN::UIntSize i) const { return m_entries[i]; }
    [[nodiscard]] auto begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_entries.end(); }

  private:
    std::vector<Entry> m_entries;
    std::unordered_map<std::string, NGIN::UIntSize> m_index;
  };

  class NGIN_INSPECT_API List
  {
  public:
    List() = default;
    List(std::initializer_list<Value> values) : m_values(values) {}

    List &PushBack(Value value)
    {
      m_values.push_back(std::move(value));
      return *this;
    }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_values.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_values.empty(); }
    [[nodiscard]] const Value &operator[](NGIN::UIntSize i) const { return m_values[i]; }

    [[nodiscard]] auto begin() const noexcept { return m_values.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_values.end(); }

  private:
    std::vector<Value> m_values;
  };

  [[nodiscard]] inline MapPtr MakeMap(std::initializer_list<Map::Entry> entries = {})
  {
    return std::make_shared<Map>(entries);
  }

  [[nodiscard]] inline ListPtr MakeList(std::initializer_list<Value> values = {})
  {
    return std::make_shared<List>(values);
  }

} // namespace NGIN::Inspect::Dynamic
