#include <NGIN/Inspect/Context.hpp>

#include <string>
#include <utility>

namespace NGIN::Inspect
{

  Context Project(const Node &node)
  {
    namespace K = ContextKeys;
    Context ctx = Context::object();
    ctx[K::Title] = node.title;
    ctx[K::Id] = node.identity;
    ctx[K::Type] = node.typeName;
    ctx[K::Prefix] = std::string{node.prefix};
    ctx[K::LinkTo] = node.linkTo ? Context(*node.linkTo) : Context(nullptr);
    ctx[K::Value] = node.valueText;
    ctx[K::Postfix] = std::string{node.postfix};
    ctx[K::TotalChildren] = node.declaredChildCount ? Context(*node.declaredChildCount) : Context(nullptr);
    ctx[K::InspectType] = std::string{KindName(node.kind)};

    if (const auto *children = node.Children())
    {
      Context list = Context::array();
      for (const auto &child : *children)
        list.push_back(Project(child));
      ctx[K::Children] = std::move(list);
    }
    else
    {
      ctx[K::Children] = nullptr;
    }
    return ctx;
  }

  Context MakeErrorContext(std::string_view message)
  {
    Context ctx = Context::object();
    ctx[ContextKeys::Error] = std::string{message};
    return ctx;
  }

} // namespace NGIN::Inspect
