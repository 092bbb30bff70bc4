#include <NGIN/Inspect/Dynamic.hpp>

namespace NGIN::Inspect::Dynamic
{

  Map::Map(std::initializer_list<Entry> entries)
  {
    m_entries.reserve(entries.size());
    for (const auto &e : entries)
      Set(e.first, e.second);
  }

  Map &Map::Set(std::string key, Value value)
  {
    if (auto it = m_index.find(key); it != m_index.end())
    {
      m_entries[it->second].second = std::move(value);
      return *this;
    }
    m_index.emplace(key, m_entries.size());
    m_entries.emplace_back(std::move(key), std::move(value));
    return *this;
  }

  const Value *Map::Find(std::string_view key) const
  {
    auto it = m_index.find(std::string{key});
    if (it == m_index.end())
      return nullptr;
    return &m_entries[it->second].second;
  }

} // namespace NGIN::Inspect::Dynamic
