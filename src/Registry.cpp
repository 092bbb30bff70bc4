#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/Shape.hpp>

#include <optional>

namespace NGIN::Inspect::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }
  namespace
  {
    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);
  }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  std::string_view InternName(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.Intern(s);
  }

} // namespace NGIN::Inspect::detail

namespace NGIN::Inspect
{

  using detail::GetRegistry;
  namespace
  {
    constexpr const char *kStaleHandle = "stale handle";

    bool IsTypeAlive(TypeHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().types.Size();
    }

    bool IsMemberAlive(MemberHandle h)
    {
      if (!IsTypeAlive(TypeHandle{h.typeIndex}))
        return false;
      return h.memberIndex < GetRegistry().types[h.typeIndex].members.Size();
    }

    const detail::MemberRuntimeDesc &MemberDesc(MemberHandle h)
    {
      return GetRegistry().types[h.typeIndex].members[h.memberIndex];
    }

    std::expected<AttributeView, Error> FindAttribute(const NGIN::Containers::Vector<AttributeDesc> &v,
                                                      std::string_view key)
    {
      for (NGIN::UIntSize i = 0; i < v.Size(); ++i)
        if (v[i].key == key)
          return AttributeView{v[i].key, &v[i].value};
      return std::unexpected(Error{ErrorCode::NotFound, "attribute not found"});
    }
  } // namespace

  // Type
  std::string_view Type::QualifiedName() const
  {
    if (!IsTypeAlive(m_h))
      return {};
    return GetRegistry().types[m_h.index].qualifiedName;
  }

  NGIN::UIntSize Type::Size() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].sizeBytes;
  }

  NGIN::UIntSize Type::Alignment() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].alignBytes;
  }

  NGIN::UIntSize Type::MemberCount() const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    return GetRegistry().types[m_h.index].members.Size();
  }

  Member Type::MemberAt(NGIN::UIntSize i) const
  {
    return Member{MemberHandle{m_h.index, static_cast<NGIN::UInt32>(i)}};
  }

  ExpectedMember Type::GetMember(std::string_view name) const
  {
    if (!IsTypeAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    const auto &tdesc = GetRegistry().types[m_h.index];
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = tdesc.memberIndex.GetPtr(nid))
        return Member{MemberHandle{m_h.index, *p}};
    }
    return std::unexpected(Error{ErrorCode::NotFound, "member not found"});
  }

  std::optional<Member> Type::FindMember(std::string_view name) const
  {
    auto m = GetMember(name);
    if (!m)
      return std::nullopt;
    return *m;
  }

  NGIN::UIntSize Type::CountOf(MemberKind kind) const
  {
    if (!IsTypeAlive(m_h))
      return 0;
    const auto &members = GetRegistry().types[m_h.index].members;
    NGIN::UIntSize n = 0;
    for (NGIN::UIntSize i = 0; i < members.Size(); ++i)
      if (members[i].kind == kind)
        ++n;
    return n;
  }

  std::expected<AttributeView, Error> Type::Attribute(std::string_view key) const
  {
    if (!IsTypeAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    return FindAttribute(GetRegistry().types[m_h.index].attributes, key);
  }

  bool Type::HasFlag(std::string_view key) const
  {
    auto a = Attribute(key);
    return a.has_value() && IsTruthy(a->Value());
  }

  // Member
  std::string_view Member::Name() const
  {
    if (!IsMemberAlive(m_h))
      return {};
    return MemberDesc(m_h).name;
  }

  MemberKind Member::Kind() const
  {
    if (!IsMemberAlive(m_h))
      return MemberKind::Field;
    return MemberDesc(m_h).kind;
  }

  const Shape *Member::ValueShape() const
  {
    if (!IsMemberAlive(m_h))
      return nullptr;
    const auto &m = MemberDesc(m_h);
    return m.ValueShape ? &m.ValueShape() : nullptr;
  }

  bool Member::IsTypeHandle() const
  {
    if (!IsMemberAlive(m_h))
      return false;
    return MemberDesc(m_h).typeHandle;
  }

  NGIN::UIntSize Member::ParameterCount() const
  {
    if (!IsMemberAlive(m_h))
      return 0;
    return MemberDesc(m_h).parameters.Size();
  }

  std::string_view Member::ParameterAt(NGIN::UIntSize i) const
  {
    if (!IsMemberAlive(m_h))
      return {};
    const auto &params = MemberDesc(m_h).parameters;
    return i < params.Size() ? params[i] : std::string_view{};
  }

  std::expected<AttributeView, Error> Member::Attribute(std::string_view key) const
  {
    if (!IsMemberAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    return FindAttribute(MemberDesc(m_h).attributes, key);
  }

  bool Member::HasFlag(std::string_view key) const
  {
    auto a = Attribute(key);
    return a.has_value() && IsTruthy(a->Value());
  }

  std::expected<ValueRef, Error> Member::Read(const void *obj) const
  {
    if (!IsMemberAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (obj == nullptr)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null instance"});
    const auto &m = MemberDesc(m_h);
    switch (m.kind)
    {
      case MemberKind::Field:
      case MemberKind::Property:
        return m.Read(obj);
      case MemberKind::Method:
      {
        std::vector<std::string_view> params;
        params.reserve(m.parameters.Size());
        for (NGIN::UIntSize i = 0; i < m.parameters.Size(); ++i)
          params.push_back(m.parameters[i]);
        return detail::Box(BoundMethod{m.name, std::move(params)});
      }
      case MemberKind::StaticMethod:
        break;
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "static methods have no instance value"});
  }

  // Queries
  ExpectedType GetType(std::string_view name)
  {
    auto &reg = GetRegistry();
    NameId nid{};
    if (detail::FindNameId(name, nid))
    {
      if (auto *p = reg.byName.GetPtr(nid))
        return Type{TypeHandle{*p}};
    }
    return std::unexpected(Error{ErrorCode::NotFound, "type not found"});
  }

  std::optional<Type> FindType(std::string_view name)
  {
    auto t = GetType(name);
    if (!t)
      return std::nullopt;
    return *t;
  }

  Type TypeAt(NGIN::UInt32 index)
  {
    return Type{TypeHandle{index}};
  }

} // namespace NGIN::Inspect
