#include <NGIN/Inspect/Manager.hpp>
#include <NGIN/Inspect/Classifier.hpp>
#include <NGIN/Inspect/Context.hpp>
#include <NGIN/Inspect/Log.hpp>
#include <NGIN/Inspect/Style.hpp>

#include <NGIN/Containers/HashMap.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace NGIN::Inspect
{

  namespace
  {
    constexpr std::string_view kTag = "Manager";

    // State of one Inspect call. Destroyed with the call, so identities and
    // retained temporaries never leak into another traversal.
    class TraversalScope final : public ChildHook
    {
    public:
      explicit TraversalScope(const InspectOptions &options) : m_options(options) {}

      TraversalScope(const TraversalScope &) = delete;
      TraversalScope &operator=(const TraversalScope &) = delete;

      // False when the same object (address and type) was already registered
      // in this traversal. A struct and its first member share an address but
      // not a shape, so both are kept.
      bool Register(const ValueRef &value)
      {
        const auto address = static_cast<NGIN::UInt64>(reinterpret_cast<std::uintptr_t>(value.address));
        if (auto *slot = m_visited.GetPtr(address))
        {
          auto &shapes = m_shapesAt[*slot];
          if (std::find(shapes.begin(), shapes.end(), value.shape) != shapes.end())
            return false;
          shapes.push_back(value.shape);
          return true;
        }
        m_visited.Insert(address, static_cast<NGIN::UInt32>(m_shapesAt.size()));
        m_shapesAt.push_back({value.shape});
        return true;
      }

      ExpectedNode MakeChild(std::string title, const ValueRef &value, std::int64_t depth) override
      {
        const ValueRef resolved = value.Resolve();
        if (!resolved.IsValid())
          return std::unexpected(Error{ErrorCode::InvalidArgument, "child value has no shape"});
        Retain(resolved.owner);
        if (resolved.shape->kind != NodeKind::Scalar)
        {
          if (!Register(resolved))
            return MakeDuplicate(std::move(title), resolved, resolved.GetIdentity());
        }
        return Classify(*this, std::move(title), resolved, depth);
      }

      NGIN::UIntSize MaxItems() const noexcept override { return m_options.maxItems; }

      void Retain(std::shared_ptr<const void> owner) override
      {
        if (owner)
          m_retained.push_back(std::move(owner));
      }

    private:
      const InspectOptions &m_options;
      // address -> index into m_shapesAt
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_visited;
      std::vector<std::vector<const Shape *>> m_shapesAt;
      std::vector<std::shared_ptr<const void>> m_retained;
    };
  } // namespace

  ExpectedNode Manager::InspectValue(std::string_view name, const ValueRef &value) const
  {
    const ValueRef root = value.Resolve();
    if (!root.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "value has no shape"});

    TraversalScope scope{m_options};
    scope.Retain(root.owner);
    if (root.shape->kind != NodeKind::Scalar)
      scope.Register(root);

    // The root itself does not consume depth: maxDepth counts generations below it.
    auto node = Classify(scope, std::string{name}, root, static_cast<std::int64_t>(m_options.maxDepth) + 1);
    if (!node)
      NGIN_INSPECT_LOG(Error, kTag, "inspection of '{}' aborted: {}", name, node.error().message);
    return node;
  }

  std::expected<std::string, Error> Manager::FormatValue(std::string_view name, const ValueRef &value,
                                                         std::string_view styleName) const
  {
    auto style = FindStyle(styleName);
    if (!style)
      return std::unexpected(std::move(style.error()));
    auto node = InspectValue(name, value);
    if (!node)
      return std::unexpected(std::move(node.error()));
    return (*style)->Render(Project(*node));
  }

} // namespace NGIN::Inspect
