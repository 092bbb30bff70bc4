#include <NGIN/Inspect/Classifier.hpp>
#include <NGIN/Inspect/Callable.hpp>
#include <NGIN/Inspect/Log.hpp>
#include <NGIN/Inspect/NameUtils.hpp>
#include <NGIN/Inspect/Scalar.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace NGIN::Inspect
{

  namespace
  {
    constexpr std::string_view kTag = "Classifier";

    struct Entry
    {
      std::string key;
      ValueRef value;
    };

    class CollectingVisitor final : public EntryVisitor
    {
    public:
      explicit CollectingVisitor(NGIN::UIntSize limit) : m_limit(limit) { m_entries.reserve(std::min<NGIN::UIntSize>(limit, 64)); }

      bool Visit(std::string key, const ValueRef &value) override
      {
        if (m_entries.size() >= m_limit)
          return false;
        m_entries.push_back(Entry{std::move(key), value});
        return m_entries.size() < m_limit;
      }

      std::vector<Entry> &Entries() noexcept { return m_entries; }

    private:
      NGIN::UIntSize m_limit;
      std::vector<Entry> m_entries;
    };

    std::string_view OpenFor(NodeKind kind)
    {
      switch (kind)
      {
        case NodeKind::Scalar: return "=";
        case NodeKind::BoundMethod:
        case NodeKind::PartialCall: return "(";
        case NodeKind::Sequence:
        case NodeKind::LazyCollection: return "[";
        case NodeKind::Mapping:
        case NodeKind::Composite: return "{";
        case NodeKind::Duplicate: return "";
      }
      return "";
    }

    std::string_view CloseFor(NodeKind kind)
    {
      switch (kind)
      {
        case NodeKind::BoundMethod:
        case NodeKind::PartialCall: return ")";
        case NodeKind::Sequence:
        case NodeKind::LazyCollection: return "]";
        case NodeKind::Mapping:
        case NodeKind::Composite: return "}";
        default: return "";
      }
    }

    std::string ScalarDisplay(const Node &node, const ValueRef &value)
    {
      auto text = value.shape->Text(value.address);
      if (detail::IsSecretName(node.title))
        return detail::Mask(text);
      if (value.shape->quoted)
        return detail::Quote(text);
      return text;
    }

    Node ErrorLeaf(std::string title, const Error &error)
    {
      Node leaf{};
      leaf.kind = NodeKind::Scalar;
      leaf.title = std::move(title);
      leaf.typeName = "error";
      leaf.valueText = fmt::format("(error: {})", error.message);
      leaf.prefix = OpenFor(NodeKind::Scalar);
      return leaf;
    }

    ExpectedNode ExpandEntries(ChildHook &hook, Node &node, const ValueRef &value, std::int64_t remaining)
    {
      const auto limit = hook.MaxItems();
      CollectingVisitor visitor{limit};
      NGIN::UIntSize total = 0;
      // Lazy sources may fetch remotely; a failed fetch replaces the whole node.
      try
      {
        total = value.shape->Count(value.address);
        if (remaining > 0 && limit > 0)
          value.shape->Enumerate(value.address, limit, visitor);
      }
      catch (const std::exception &e)
      {
        NGIN_INSPECT_LOG(Warning, kTag, "reading entries of '{}' failed: {}", node.title, e.what());
        return ErrorLeaf(std::move(node.title), Error{ErrorCode::AccessFailed, e.what()});
      }
      node.declaredChildCount = total;
      if (remaining <= 0)
        return std::move(node);

      if (total > limit)
        NGIN_INSPECT_LOG(Debug, kTag, "'{}' truncated to {} of {} entries", node.title, limit, total);

      node.expanded = true;
      node.children.reserve(visitor.Entries().size());
      for (auto &entry : visitor.Entries())
      {
        auto child = hook.MakeChild(std::move(entry.key), entry.value, remaining);
        if (!child)
          return std::unexpected(std::move(child.error()));
        node.children.push_back(std::move(*child));
      }
      return std::move(node);
    }

    ExpectedNode ExpandComposite(ChildHook &hook, Node &node, const ValueRef &value, std::int64_t remaining)
    {
      const Type type = TypeAt(value.shape->TypeIndex());
      node.typeName = std::string{type.QualifiedName()};
      node.declaredChildCount = VisibleMemberCount(type);
      if (remaining <= 0)
        return std::move(node);

      node.expanded = true;
      for (NGIN::UIntSize i = 0; i < type.MemberCount(); ++i)
      {
        const Member member = type.MemberAt(i);
        if (!IsVisibleMember(member))
          continue;
        std::string title{member.Name()};
        auto read = member.Read(value.address);
        if (!read)
        {
          NGIN_INSPECT_LOG(Warning, kTag, "reading '{}.{}' failed: {}", type.QualifiedName(), title,
                           read.error().message);
          node.children.push_back(ErrorLeaf(std::move(title), read.error()));
          continue;
        }
        auto child = hook.MakeChild(std::move(title), *read, remaining);
        if (!child)
          return std::unexpected(std::move(child.error()));
        node.children.push_back(std::move(*child));
      }
      return std::move(node);
    }
  } // namespace

  bool IsVisibleMember(const Member &member)
  {
    if (!member.IsValid() || member.IsStaticMethod() || member.IsTypeHandle())
      return false;
    if (detail::IsPrivateName(member.Name()))
      return false;
    if (member.HasFlag(Attributes::DoNotCallInTemplates) || member.HasFlag(Attributes::Hidden))
      return false;
    if (const Shape *shape = member.ValueShape(); shape && shape->kind == NodeKind::Composite && shape->TypeIndex)
    {
      const Type valueType = TypeAt(shape->TypeIndex());
      if (valueType.HasFlag(Attributes::DoNotCallInTemplates) || valueType.HasFlag(Attributes::Hidden))
        return false;
    }
    return true;
  }

  NGIN::UIntSize VisibleMemberCount(const Type &type)
  {
    NGIN::UIntSize n = 0;
    for (NGIN::UIntSize i = 0; i < type.MemberCount(); ++i)
      if (IsVisibleMember(type.MemberAt(i)))
        ++n;
    return n;
  }

  Node MakeDuplicate(std::string title, const ValueRef &value, Identity first)
  {
    Node node{};
    node.identity = first;
    node.kind = NodeKind::Duplicate;
    node.title = std::move(title);
    if (value.shape)
      node.typeName = std::string{value.shape->typeName};
    node.valueText = std::string{kDuplicatedText};
    node.linkTo = first;
    return node;
  }

  ExpectedNode Classify(ChildHook &hook, std::string title, const ValueRef &value, std::int64_t depth)
  {
    if (depth <= 0)
      return std::unexpected(Error{ErrorCode::DepthExhausted,
                                   fmt::format("'{}' classified with {} remaining depth", title, depth)});

    const ValueRef resolved = value.Resolve();
    if (!resolved.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, fmt::format("'{}' has no shape", title)});
    hook.Retain(resolved.owner);

    const Shape &shape = *resolved.shape;
    Node node{};
    node.identity = resolved.GetIdentity();
    node.kind = shape.kind;
    node.title = std::move(title);
    node.typeName = std::string{shape.typeName};
    node.prefix = OpenFor(shape.kind);
    node.postfix = CloseFor(shape.kind);
    const std::int64_t remaining = depth - 1;

    switch (shape.kind)
    {
      case NodeKind::Scalar:
        try
        {
          node.valueText = ScalarDisplay(node, resolved);
        }
        catch (const std::exception &e)
        {
          NGIN_INSPECT_LOG(Warning, kTag, "formatting '{}' failed: {}", node.title, e.what());
          return ErrorLeaf(std::move(node.title), Error{ErrorCode::AccessFailed, e.what()});
        }
        return node;
      case NodeKind::BoundMethod:
        node.valueText = static_cast<const BoundMethod *>(resolved.address)->Signature();
        return node;
      case NodeKind::PartialCall:
      {
        const auto *partial = static_cast<const Partial *>(resolved.address);
        node.title = partial->Title(node.title);
        node.valueText = partial->Signature();
        return node;
      }
      case NodeKind::Mapping:
      case NodeKind::Sequence:
      case NodeKind::LazyCollection:
        return ExpandEntries(hook, node, resolved, remaining);
      case NodeKind::Composite:
        return ExpandComposite(hook, node, resolved, remaining);
      case NodeKind::Duplicate:
        break;
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, fmt::format("'{}' has no display variant", node.title)});
  }

} // namespace NGIN::Inspect
