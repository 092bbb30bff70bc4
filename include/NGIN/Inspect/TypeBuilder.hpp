// TypeBuilder.hpp
// Public TypeBuilder<T> used inside the ADL friend to describe what an
// inspection of T may show: fields, read-only properties and methods.
#pragma once

#include <NGIN/Meta/TypeName.hpp>

#include <NGIN/Inspect/NameUtils.hpp>
#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/Shape.hpp>

#include <fmt/format.h>

#include <exception>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Inspect
{

  namespace detail
  {
    template <typename>
    struct MethodTraits;

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Ret = R;
      static constexpr bool IsConst = false;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const> : MethodTraits<R (C::*)(A...)>
    {
      static constexpr bool IsConst = true;
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) noexcept> : MethodTraits<R (C::*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const noexcept> : MethodTraits<R (C::*)(A...) const>
    {
    };

    template <typename>
    struct FunctionTraits;

    template <class R, class... A>
    struct FunctionTraits<R (*)(A...)>
    {
      using Ret = R;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class R, class... A>
    struct FunctionTraits<R (*)(A...) noexcept> : FunctionTraits<R (*)(A...)>
    {
    };

    template <class>
    inline constexpr bool is_expected_v = false;
    template <class V, class E>
    inline constexpr bool is_expected_v<std::expected<V, E>> = true;

    // Declared value type of a property getter, looking through std::expected.
    template <class R>
    struct PropertyValue
    {
      using type = std::remove_cvref_t<R>;
    };
    template <class V, class E>
    struct PropertyValue<std::expected<V, E>>
    {
      using type = std::remove_cvref_t<V>;
    };

    template <class E>
    std::string ErrorText(const E &error)
    {
      if constexpr (std::is_same_v<E, Error>)
        return error.message;
      else if constexpr (std::is_convertible_v<const E &, std::string_view>)
        return std::string{std::string_view{error}};
      else if constexpr (ScalarType<E>)
        return ScalarText(error);
      else
        return fmt::format("<{}>", NGIN::Meta::TypeName<E>::qualifiedName);
    }

    template <auto MemberPtr>
    std::expected<ValueRef, Error> FieldRead(const void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      return MakeValueRef(static_cast<const C *>(obj)->*MemberPtr);
    }

    // Calls the getter; results returned by value are retained through the
    // view's owner. Thrown std::exceptions and unexpected results become
    // AccessFailed.
    template <auto Getter>
    std::expected<ValueRef, Error> PropertyRead(const void *obj)
    {
      using Traits = MethodTraits<decltype(Getter)>;
      using R = typename Traits::Ret;
      const auto *c = static_cast<const typename Traits::Class *>(obj);
      try
      {
        if constexpr (std::is_lvalue_reference_v<R>)
        {
          return MakeValueRef((c->*Getter)());
        }
        else if constexpr (is_expected_v<std::remove_cv_t<R>>)
        {
          auto result = (c->*Getter)();
          if (!result)
            return std::unexpected(Error{ErrorCode::AccessFailed, ErrorText(result.error())});
          return Box(std::move(*result));
        }
        else
        {
          return Box((c->*Getter)());
        }
      }
      catch (const std::exception &e)
      {
        return std::unexpected(Error{ErrorCode::AccessFailed, e.what()});
      }
    }

    inline AttributeDesc InternAttribute(std::string_view key, const AttrValue &value)
    {
      AttributeDesc desc{InternName(key), value};
      if (auto *sv = std::get_if<std::string_view>(&desc.value))
        desc.value = InternName(*sv);
      return desc;
    }
  } // namespace detail

  template <class T>
  class TypeBuilder
  {
  public:
    // Note: constructed by the registry when invoking ADL reflect; binds to a specific type index.
    explicit TypeBuilder(NGIN::UInt32 typeIndex) : m_index(typeIndex) {}

    // Display name override. If not set, defaults to Meta::TypeName<T>.
    TypeBuilder &SetName(std::string_view qualified)
    {
      auto &reg = detail::GetRegistry();
      auto id = detail::InternNameId(qualified);
      reg.types[m_index].qualifiedNameId = id;
      reg.types[m_index].qualifiedName = detail::NameFromId(id);
      reg.byName.Insert(id, m_index);
      return *this;
    }

    // Public data member; name defaults to the member identifier.
    template <auto MemberPtr>
    TypeBuilder &Field(std::string_view name = {})
    {
      using MemberT = std::remove_cv_t<detail::MemberTypeT<MemberPtr>>;
      static_assert(std::is_same_v<detail::MemberClassT<MemberPtr>, T>, "Field must belong to T");
      detail::MemberRuntimeDesc m{};
      m.kind = MemberKind::Field;
      m.key = detail::MakeMemberKey<MemberPtr>();
      m.ValueShape = &ShapeOf<MemberT>;
      m.typeHandle = std::is_same_v<MemberT, Type>;
      m.Read = &detail::FieldRead<MemberPtr>;
      return Add(std::move(m), name.empty() ? detail::MemberNameFromPretty<MemberPtr>() : name);
    }

    // Read-only property backed by a const getter. Getters may return by value,
    // by reference or as std::expected<V, E>.
    template <auto Getter>
    TypeBuilder &Property(std::string_view name)
    {
      using Traits = detail::MethodTraits<decltype(Getter)>;
      static_assert(std::is_same_v<typename Traits::Class, T>, "Property getter must belong to T");
      static_assert(Traits::IsConst && Traits::Arity == 0, "Property getter must be a const member function without parameters");
      static_assert(!std::is_void_v<typename Traits::Ret>, "Property getter must return a value");
      using ValueT = typename detail::PropertyValue<std::remove_cv_t<typename Traits::Ret>>::type;
      detail::MemberRuntimeDesc m{};
      m.kind = MemberKind::Property;
      m.key = detail::MakeMemberKey<Getter>();
      m.ValueShape = &ShapeOf<ValueT>;
      m.typeHandle = std::is_same_v<ValueT, Type>;
      m.Read = &detail::PropertyRead<Getter>;
      return Add(std::move(m), name);
    }

    // Member function, shown with its formal parameter names. Missing names
    // are filled in as argN.
    template <auto MemFn>
    TypeBuilder &Method(std::string_view name, std::initializer_list<std::string_view> parameters = {})
    {
      using Traits = detail::MethodTraits<decltype(MemFn)>;
      static_assert(std::is_same_v<typename Traits::Class, T>, "Method must belong to T");
      detail::MemberRuntimeDesc m{};
      m.kind = MemberKind::Method;
      m.key = detail::MakeMemberKey<MemFn>();
      AddParameters(m, parameters, Traits::Arity);
      return Add(std::move(m), name);
    }

    // Free or static function associated with T. Recorded, never shown.
    template <auto Fn>
    TypeBuilder &StaticMethod(std::string_view name, std::initializer_list<std::string_view> parameters = {})
    {
      using Traits = detail::FunctionTraits<decltype(Fn)>;
      detail::MemberRuntimeDesc m{};
      m.kind = MemberKind::StaticMethod;
      m.key = detail::MakeMemberKey<Fn>();
      AddParameters(m, parameters, Traits::Arity);
      return Add(std::move(m), name);
    }

    // Attach a typed attribute (type-level)
    TypeBuilder &Attribute(std::string_view key, const AttrValue &value)
    {
      auto &reg = detail::GetRegistry();
      reg.types[m_index].attributes.PushBack(detail::InternAttribute(key, value));
      return *this;
    }

    template <auto MemberPtr>
    TypeBuilder &FieldAttribute(std::string_view key, const AttrValue &value)
    {
      return AttachTo(detail::MakeMemberKey<MemberPtr>(), MemberKind::Field, key, value);
    }

    template <auto Getter>
    TypeBuilder &PropertyAttribute(std::string_view key, const AttrValue &value)
    {
      return AttachTo(detail::MakeMemberKey<Getter>(), MemberKind::Property, key, value);
    }

    template <auto MemFn>
    TypeBuilder &MethodAttribute(std::string_view key, const AttrValue &value)
    {
      return AttachTo(detail::MakeMemberKey<MemFn>(), MemberKind::Method, key, value);
    }

  private:
    TypeBuilder &Add(detail::MemberRuntimeDesc &&m, std::string_view name)
    {
      auto &reg = detail::GetRegistry();
      m.nameId = detail::InternNameId(name);
      m.name = detail::NameFromId(m.nameId);
      auto &tdesc = reg.types[m_index];
      const auto newIndex = static_cast<NGIN::UInt32>(tdesc.members.Size());
      tdesc.memberIndex.Insert(m.nameId, newIndex);
      tdesc.members.PushBack(std::move(m));
      return *this;
    }

    static void AddParameters(detail::MemberRuntimeDesc &m, std::initializer_list<std::string_view> names,
                              NGIN::UIntSize arity)
    {
      m.parameters.Reserve(arity);
      auto it = names.begin();
      for (NGIN::UIntSize i = 0; i < arity; ++i)
      {
        if (it != names.end())
          m.parameters.PushBack(detail::InternName(*it++));
        else
          m.parameters.PushBack(detail::InternName(fmt::format("arg{}", i)));
      }
    }

    TypeBuilder &AttachTo(const detail::MemberKey &memberKey, MemberKind kind, std::string_view key,
                          const AttrValue &value)
    {
      auto &reg = detail::GetRegistry();
      auto &members = reg.types[m_index].members;
      for (auto i = NGIN::UIntSize{0}; i < members.Size(); ++i)
      {
        if (members[i].kind == kind && members[i].key == memberKey)
        {
          members[i].attributes.PushBack(detail::InternAttribute(key, value));
          break;
        }
      }
      return *this;
    }

    NGIN::UInt32 m_index{0};
  };

} // namespace NGIN::Inspect
