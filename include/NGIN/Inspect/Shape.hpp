// Shape.hpp
// Compile-time classification of C++ types into display variants.
// ShapeOf<T>() is the single, ordered match list: Scalar, transparent
// indirections, BoundMethod, PartialCall, Mapping, Sequence, LazyCollection
// and finally Composite for everything else.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <NGIN/Inspect/Callable.hpp>
#include <NGIN/Inspect/Dynamic.hpp>
#include <NGIN/Inspect/Lazy.hpp>
#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/Scalar.hpp>
#include <NGIN/Inspect/Value.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace NGIN::Inspect
{

  template <class T>
  const Shape &ShapeOf();

  // A view of `value` typed by its static type. The caller keeps `value` alive.
  template <class T>
  ValueRef MakeValueRef(const T &value)
  {
    return ValueRef{static_cast<const void *>(std::addressof(value)), &ShapeOf<T>(), {}};
  }

  namespace detail
  {
    inline constexpr std::nullptr_t kNullValue = nullptr;

    inline ValueRef NullRef()
    {
      return MakeValueRef(kNullValue);
    }

    // Copies a temporary into shared storage so the returned view stays valid
    // for as long as someone holds its owner.
    template <class T>
    ValueRef Box(T &&value)
    {
      auto holder = std::make_shared<std::remove_cvref_t<T>>(std::forward<T>(value));
      ValueRef ref = MakeValueRef(*holder);
      ref.owner = std::move(holder);
      return ref;
    }

    // ==== Transparent indirections ====
    template <class T>
    struct IndirectionTraits;

    template <class P>
      requires(!std::is_function_v<P> && !std::is_void_v<std::remove_cv_t<P>>)
    struct IndirectionTraits<P *>
    {
      static ValueRef Unwrap(const void *p)
      {
        auto *ptr = *static_cast<P *const *>(p);
        return ptr ? MakeValueRef(*ptr) : NullRef();
      }
    };

    template <class P>
    struct IndirectionTraits<std::shared_ptr<P>>
    {
      static ValueRef Unwrap(const void *p)
      {
        const auto &ptr = *static_cast<const std::shared_ptr<P> *>(p);
        return ptr ? MakeValueRef(*ptr) : NullRef();
      }
    };

    template <class P, class D>
    struct IndirectionTraits<std::unique_ptr<P, D>>
    {
      static ValueRef Unwrap(const void *p)
      {
        const auto &ptr = *static_cast<const std::unique_ptr<P, D> *>(p);
        return ptr ? MakeValueRef(*ptr) : NullRef();
      }
    };

    template <class P>
    struct IndirectionTraits<std::reference_wrapper<P>>
    {
      static ValueRef Unwrap(const void *p)
      {
        return MakeValueRef(static_cast<const std::reference_wrapper<P> *>(p)->get());
      }
    };

    template <class P>
    struct IndirectionTraits<std::optional<P>>
    {
      static ValueRef Unwrap(const void *p)
      {
        const auto &opt = *static_cast<const std::optional<P> *>(p);
        return opt.has_value() ? MakeValueRef(*opt) : NullRef();
      }
    };

    template <class... Ts>
    struct IndirectionTraits<std::variant<Ts...>>
    {
      static ValueRef Unwrap(const void *p)
      {
        const auto &var = *static_cast<const std::variant<Ts...> *>(p);
        if (var.valueless_by_exception())
          return NullRef();
        return std::visit([](const auto &alt) { return MakeValueRef(alt); }, var);
      }
    };

    template <>
    struct IndirectionTraits<Dynamic::Value>
    {
      static ValueRef Unwrap(const void *p)
      {
        return MakeValueRef(static_cast<const Dynamic::Value *>(p)->Data());
      }
    };

    template <class T>
    concept Indirection = requires(const void *p) {
      { IndirectionTraits<T>::Unwrap(p) } -> std::same_as<ValueRef>;
    };

    // ==== Collections ====
    template <class T>
    concept MapLike = std::same_as<T, Dynamic::Map> || requires {
      typename T::key_type;
      typename T::mapped_type;
    };

    template <class T>
    concept HasStdSize = requires(const T &c) { std::size(c); };

    template <class T>
    concept HasNginSize = requires(const T &c) {
      { c.Size() } -> std::convertible_to<NGIN::UIntSize>;
    };

    template <class T>
    concept Iterable = requires(const T &c) {
      std::begin(c);
      std::end(c);
    };

    template <class T>
    concept Indexable = requires(const T &c, NGIN::UIntSize i) { c[i]; };

    template <class T>
    concept RangeLike = !MapLike<T> && (HasStdSize<T> || HasNginSize<T>) && (Iterable<T> || (HasNginSize<T> && Indexable<T>));

    template <class T>
    concept TupleLike = requires { std::tuple_size<T>::value; };

    template <class T>
    concept SequenceLike = RangeLike<T> || TupleLike<T>;

    template <class T>
    NGIN::UIntSize ContainerSize(const T &c)
    {
      if constexpr (HasNginSize<T>)
        return static_cast<NGIN::UIntSize>(c.Size());
      else
        return static_cast<NGIN::UIntSize>(std::size(c));
    }

    // Proxy references (std::vector<bool>) are boxed, real references viewed.
    template <class R>
    ValueRef ElementRef(R &&element)
    {
      if constexpr (std::is_lvalue_reference_v<R>)
        return MakeValueRef(element);
      else
        return Box(std::forward<R>(element));
    }

    template <class K>
    std::string KeyText(const K &key)
    {
      if constexpr (ScalarType<K>)
        return ScalarText(key);
      else
        return fmt::format("<{}>", NGIN::Meta::TypeName<K>::qualifiedName);
    }

    template <class T>
    struct MapShape
    {
      static NGIN::UIntSize Count(const void *p) { return ContainerSize(*static_cast<const T *>(p)); }

      static void Enumerate(const void *p, NGIN::UIntSize limit, EntryVisitor &visitor)
      {
        NGIN::UIntSize i = 0;
        for (const auto &entry : *static_cast<const T *>(p))
        {
          if (i++ >= limit)
            return;
          if (!visitor.Visit(KeyText(entry.first), MakeValueRef(entry.second)))
            return;
        }
      }
    };

    template <class T>
    struct SequenceShape
    {
      static NGIN::UIntSize Count(const void *p)
      {
        if constexpr (RangeLike<T>)
          return ContainerSize(*static_cast<const T *>(p));
        else
          return std::tuple_size_v<T>;
      }

      static void Enumerate(const void *p, NGIN::UIntSize limit, EntryVisitor &visitor)
      {
        const auto &c = *static_cast<const T *>(p);
        if constexpr (RangeLike<T> && Iterable<T>)
        {
          NGIN::UIntSize i = 0;
          for (auto it = std::begin(c); it != std::end(c) && i < limit; ++it, ++i)
          {
            if (!visitor.Visit(std::to_string(i), ElementRef(*it)))
              return;
          }
        }
        else if constexpr (RangeLike<T>)
        {
          const auto n = std::min(limit, ContainerSize(c));
          for (NGIN::UIntSize i = 0; i < n; ++i)
          {
            if (!visitor.Visit(std::to_string(i), ElementRef(c[i])))
              return;
          }
        }
        else
        {
          EnumerateTuple(c, limit, visitor, std::make_index_sequence<std::tuple_size_v<T>>{});
        }
      }

    private:
      template <std::size_t... I>
      static void EnumerateTuple(const T &c, NGIN::UIntSize limit, EntryVisitor &visitor, std::index_sequence<I...>)
      {
        bool go = true;
        ((go = go && I < limit && visitor.Visit(std::to_string(I), MakeValueRef(std::get<I>(c)))), ...);
      }
    };

    template <class T>
    struct LazyShape
    {
      static NGIN::UIntSize Count(const void *p) { return static_cast<const T *>(p)->Count(); }

      static void Enumerate(const void *p, NGIN::UIntSize limit, EntryVisitor &visitor)
      {
        const auto items = static_cast<const T *>(p)->Take(limit);
        const auto n = std::min(limit, static_cast<NGIN::UIntSize>(items.size()));
        for (NGIN::UIntSize i = 0; i < n; ++i)
        {
          if (!visitor.Visit(std::to_string(i), items[i]))
            return;
        }
      }
    };

    template <class T>
    Shape MakeShape()
    {
      Shape s{};
      s.typeName = NGIN::Meta::TypeName<T>::qualifiedName;
      s.typeId = TypeIdOf<T>();

      if constexpr (ScalarType<T>)
      {
        s.kind = NodeKind::Scalar;
        s.quoted = IsQuotedScalar<T>();
        s.Text = [](const void *p) { return ScalarText(*static_cast<const T *>(p)); };
      }
      else if constexpr (Indirection<T>)
      {
        s.Unwrap = &IndirectionTraits<T>::Unwrap;
      }
      else if constexpr (std::same_as<T, BoundMethod>)
      {
        s.kind = NodeKind::BoundMethod;
      }
      else if constexpr (std::same_as<T, Partial>)
      {
        s.kind = NodeKind::PartialCall;
      }
      else if constexpr (MapLike<T>)
      {
        s.kind = NodeKind::Mapping;
        s.Count = &MapShape<T>::Count;
        s.Enumerate = &MapShape<T>::Enumerate;
      }
      else if constexpr (SequenceLike<T>)
      {
        s.kind = NodeKind::Sequence;
        s.Count = &SequenceShape<T>::Count;
        s.Enumerate = &SequenceShape<T>::Enumerate;
      }
      else if constexpr (std::derived_from<T, LazyCollection>)
      {
        s.kind = NodeKind::LazyCollection;
        s.Count = &LazyShape<T>::Count;
        s.Enumerate = &LazyShape<T>::Enumerate;
      }
      else
      {
        s.kind = NodeKind::Composite;
        s.isTypeHandle = std::same_as<T, Type>;
        s.TypeIndex = &EnsureRegistered<T>;
      }
      return s;
    }

  } // namespace detail

  template <class T>
  const Shape &ShapeOf()
  {
    using U = std::remove_cv_t<T>;
    if constexpr (!std::is_same_v<U, T>)
    {
      return ShapeOf<U>();
    }
    else
    {
      static const Shape shape = detail::MakeShape<T>();
      return shape;
    }
  }

  template <class T>
  std::vector<ValueRef> LazyRange<T>::Take(NGIN::UIntSize n) const
  {
    std::vector<ValueRef> out;
    if (!m_fetch || n == 0)
      return out;
    auto rows = std::make_shared<std::vector<T>>(m_fetch(n));
    const auto count = std::min(n, static_cast<NGIN::UIntSize>(rows->size()));
    out.reserve(count);
    for (NGIN::UIntSize i = 0; i < count; ++i)
    {
      ValueRef ref = detail::ElementRef((*rows)[i]);
      if (!ref.owner)
        ref.owner = rows;
      out.push_back(std::move(ref));
    }
    return out;
  }

  template <class V>
  std::optional<std::string> Partial::BoundText(const V &value)
  {
    const ValueRef resolved = MakeValueRef(value).Resolve();
    if (!resolved.IsValid() || resolved.shape->kind != NodeKind::Scalar)
      return std::nullopt;
    return resolved.shape->Text(resolved.address);
  }

} // namespace NGIN::Inspect
