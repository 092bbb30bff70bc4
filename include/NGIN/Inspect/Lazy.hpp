// Lazy.hpp
// Collections whose size is known up front and whose elements are fetched on
// demand (query results, cursors, paged stores).
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Inspect/Value.hpp>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace NGIN::Inspect
{

  // Capability interface for deferred collections. The inspector calls Count()
  // once and Take() with at most its breadth budget; it never iterates the
  // whole collection.
  class LazyCollection
  {
  public:
    virtual ~LazyCollection() = default;

    [[nodiscard]] virtual NGIN::UIntSize Count() const = 0;
    // The first `n` elements, in order. Returned references may own their
    // storage through ValueRef::owner.
    [[nodiscard]] virtual std::vector<ValueRef> Take(NGIN::UIntSize n) const = 0;
  };

  // Adapts a count query and a bounded fetch over any backing store.
  template <class T>
  class LazyRange final : public LazyCollection
  {
  public:
    using CountFn = std::function<NGIN::UIntSize()>;
    using FetchFn = std::function<std::vector<T>(NGIN::UIntSize)>;

    LazyRange(CountFn count, FetchFn fetch) : m_count(std::move(count)), m_fetch(std::move(fetch)) {}

    [[nodiscard]] NGIN::UIntSize Count() const override { return m_count ? m_count() : 0; }

    [[nodiscard]] std::vector<ValueRef> Take(NGIN::UIntSize n) const override;

  private:
    CountFn m_count;
    FetchFn m_fetch;
  };

} // namespace NGIN::Inspect
