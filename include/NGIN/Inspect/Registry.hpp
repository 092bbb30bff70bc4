// Registry.hpp
// Process-wide table of reflected composite types and the query API over it.
// Composite values are only as visible as their registration: fields,
// properties and methods described through TypeBuilder<T>.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <array>
#include <concepts>
#include <cstring>
#include <expected>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Types.hpp>
#include <NGIN/Inspect/Value.hpp>

namespace NGIN::Inspect
{
  using NameId = NGIN::UInt32;

  template <class T>
  struct Tag
  {
    using type = T;
  };
  template <class T>
  class TypeBuilder;

  // Optional external customization point for types you cannot modify
  // Specialize in namespace NGIN::Inspect: template<> struct Describe<MyType> { static void Do(TypeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  using AttrValue = std::variant<bool, std::int64_t, double, std::string_view>;

  struct AttributeDesc
  {
    std::string_view key;
    AttrValue value;
  };

  // Attribute keys understood by the inspector.
  namespace Attributes
  {
    // Members (or member types) carrying this flag are never shown.
    inline constexpr std::string_view DoNotCallInTemplates = "do_not_call_in_templates";
    inline constexpr std::string_view Hidden = "hidden";
  } // namespace Attributes

  [[nodiscard]] constexpr bool IsTruthy(const AttrValue &value) noexcept
  {
    if (auto *b = std::get_if<bool>(&value))
      return *b;
    if (auto *i = std::get_if<std::int64_t>(&value))
      return *i != 0;
    if (auto *d = std::get_if<double>(&value))
      return *d != 0.0;
    return !std::get<std::string_view>(value).empty();
  }

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    NGIN_INSPECT_API NameId InternNameId(std::string_view s) noexcept;
    NGIN_INSPECT_API bool FindNameId(std::string_view s, NameId &out) noexcept;
    NGIN_INSPECT_API std::string_view NameFromId(NameId id) noexcept;
    NGIN_INSPECT_API std::string_view InternName(std::string_view s) noexcept;

    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    // Bytes of a member pointer; identifies a registered member when
    // attributes are attached after the fact.
    struct MemberKey
    {
      std::array<unsigned char, 32> bytes{};
      NGIN::UIntSize size{0};
      bool operator==(const MemberKey &) const = default;
    };

    template <auto Ptr>
    MemberKey MakeMemberKey() noexcept
    {
      static_assert(sizeof(Ptr) <= 32, "member pointer too large for MemberKey");
      MemberKey key{};
      const auto ptr = Ptr;
      std::memcpy(key.bytes.data(), &ptr, sizeof(ptr));
      key.size = sizeof(ptr);
      return key;
    }

    struct MemberRuntimeDesc
    {
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      MemberKind kind{MemberKind::Field};
      MemberKey key{};
      // Declared value shape (fields and properties)
      const Shape &(*ValueShape)(){nullptr};
      bool typeHandle{false};
      std::expected<ValueRef, Error> (*Read)(const void *){nullptr};
      // Formal parameter names (methods), receiver excluded
      NGIN::Containers::Vector<std::string_view> parameters;
      NGIN::Containers::Vector<AttributeDesc> attributes;
    };

    struct TypeRuntimeDesc
    {
      std::string_view qualifiedName;
      NameId qualifiedNameId{static_cast<NameId>(-1)};
      NGIN::UIntSize sizeBytes;
      NGIN::UIntSize alignBytes;
      NGIN::Containers::Vector<MemberRuntimeDesc> members;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> memberIndex;
      NGIN::Containers::Vector<AttributeDesc> attributes;
    };

    struct Registry
    {
      NGIN::Containers::Vector<TypeRuntimeDesc> types;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> byName;

      StringInterner names;
    };

    NGIN_INSPECT_API Registry &GetRegistry() noexcept;

    template <class T>
    concept HasNginReflectWithTypeBuilder = requires(TypeBuilder<T> &b) {
      // ADL friend should be declared as: friend void NginReflect(Tag<T>, TypeBuilder<T>&)
      { NginReflect(Tag<T>{}, b) } -> std::same_as<void>;
    };

    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(NGIN::Inspect::Describe<T>::Do(std::declval<TypeBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeWithTypeBuilder = HasDescribeImpl<T>::value;

    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    // Ensure a type is present; returns the type index
    template <class T>
    NGIN::UInt32 EnsureRegistered()
    {
      using U = std::remove_cvref_t<T>;
      auto &reg = GetRegistry();
      const auto tid = TypeIdOf<U>();
      if (auto *p = reg.byTypeId.GetPtr(tid))
        return *p;

      TypeRuntimeDesc rec{};
      rec.qualifiedNameId = InternNameId(NGIN::Meta::TypeName<U>::qualifiedName);
      rec.qualifiedName = NameFromId(rec.qualifiedNameId);
      rec.sizeBytes = sizeof(U);
      rec.alignBytes = alignof(U);

      const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
      reg.types.PushBack(std::move(rec));
      reg.byTypeId.Insert(tid, idx);
      reg.byName.Insert(reg.types[idx].qualifiedNameId, idx);

      if constexpr (HasNginReflectWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        NginReflect(Tag<U>{}, b);
      }
      else if constexpr (HasDescribeWithTypeBuilder<U>)
      {
        TypeBuilder<U> b{idx};
        NGIN::Inspect::Describe<U>::Do(b);
      }
      return idx;
    }

  } // namespace detail

  class AttributeView
  {
  public:
    AttributeView() = default;
    AttributeView(std::string_view k, const AttrValue *v) : m_key(k), m_val(v) {}
    [[nodiscard]] std::string_view Key() const { return m_key; }
    [[nodiscard]] const AttrValue &Value() const { return *m_val; }

  private:
    std::string_view m_key{};
    const AttrValue *m_val{nullptr};
  };

  class NGIN_INSPECT_API Member
  {
  public:
    constexpr Member() = default;
    explicit constexpr Member(MemberHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      const auto &reg = detail::GetRegistry();
      return m_h.typeIndex < reg.types.Size() && m_h.memberIndex < reg.types[m_h.typeIndex].members.Size();
    }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] MemberKind Kind() const;
    [[nodiscard]] bool IsField() const { return Kind() == MemberKind::Field; }
    [[nodiscard]] bool IsProperty() const { return Kind() == MemberKind::Property; }
    [[nodiscard]] bool IsMethod() const { return Kind() == MemberKind::Method; }
    [[nodiscard]] bool IsStaticMethod() const { return Kind() == MemberKind::StaticMethod; }

    // Declared value shape of a field or property; null for callables.
    [[nodiscard]] const Shape *ValueShape() const;
    [[nodiscard]] bool IsTypeHandle() const;

    [[nodiscard]] NGIN::UIntSize ParameterCount() const;
    [[nodiscard]] std::string_view ParameterAt(NGIN::UIntSize i) const;

    [[nodiscard]] std::expected<AttributeView, Error> Attribute(std::string_view key) const;
    // True when the attribute exists and is truthy.
    [[nodiscard]] bool HasFlag(std::string_view key) const;

    // Reads the member from an instance: a view for fields, the materialised
    // getter result for properties, a BoundMethod for methods.
    [[nodiscard]] std::expected<ValueRef, Error> Read(const void *obj) const;

  private:
    MemberHandle m_h{};
  };

  class NGIN_INSPECT_API Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      if (!m_h.IsValid())
        return false;
      return m_h.index < detail::GetRegistry().types.Size();
    }
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] NGIN::UIntSize Size() const;
    [[nodiscard]] NGIN::UIntSize Alignment() const;

    [[nodiscard]] NGIN::UIntSize MemberCount() const;
    [[nodiscard]] Member MemberAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedMember GetMember(std::string_view name) const;
    [[nodiscard]] std::optional<Member> FindMember(std::string_view name) const;
    [[nodiscard]] NGIN::UIntSize CountOf(MemberKind kind) const;

    [[nodiscard]] std::expected<AttributeView, Error> Attribute(std::string_view key) const;
    [[nodiscard]] bool HasFlag(std::string_view key) const;

    [[nodiscard]] TypeHandle GetHandle() const noexcept { return m_h; }

  private:
    TypeHandle m_h{};
  };

  // Queries
  NGIN_INSPECT_API ExpectedType GetType(std::string_view name);
  NGIN_INSPECT_API std::optional<Type> FindType(std::string_view name);
  NGIN_INSPECT_API Type TypeAt(NGIN::UInt32 index);

  template <class T>
  Type GetType()
  {
    return Type{TypeHandle{detail::EnsureRegistered<T>()}};
  }

  template <class T>
  std::optional<Type> TryGetType()
  {
    auto &reg = detail::GetRegistry();
    if (auto *p = reg.byTypeId.GetPtr(detail::TypeIdOf<T>()))
      return Type{TypeHandle{*p}};
    return std::nullopt;
  }

} // namespace NGIN::Inspect
