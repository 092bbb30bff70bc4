#include <NGIN/Inspect/Style.hpp>
#include <NGIN/Inspect/Context.hpp>
#include <NGIN/Inspect/Log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <vector>

namespace NGIN::Inspect
{

  namespace
  {
    constexpr std::string_view kTag = "Style";

    std::string_view TextOf(const Context &ctx, const char *key)
    {
      auto it = ctx.find(key);
      return (it != ctx.end() && it->is_string()) ? std::string_view{it->get_ref<const std::string &>()}
                                                  : std::string_view{};
    }

    // " #<id>" for nodes that a duplicate may link to.
    std::string IdSuffix(const Context &ctx)
    {
      auto it = ctx.find(ContextKeys::Id);
      if (it == ctx.end() || !it->is_number_unsigned())
        return {};
      return fmt::format(" #{:016x}", it->get<std::uint64_t>());
    }

    std::vector<std::shared_ptr<const Style>> &Styles()
    {
      static std::vector<std::shared_ptr<const Style>> styles{std::make_shared<TextStyle>()};
      return styles;
    }
  } // namespace

  std::string TextStyle::Render(const Context &context) const
  {
    std::string out;
    if (auto error = context.find(ContextKeys::Error); error != context.end() && error->is_string())
    {
      out = fmt::format("error: {}\n", error->get<std::string>());
      return out;
    }
    RenderNode(context, 0, out);
    return out;
  }

  void TextStyle::RenderNode(const Context &ctx, NGIN::UIntSize level, std::string &out) const
  {
    const std::string indent(level * m_indentWidth, ' ');
    const auto title = TextOf(ctx, ContextKeys::Title);
    const auto value = TextOf(ctx, ContextKeys::Value);
    const auto prefix = TextOf(ctx, ContextKeys::Prefix);
    const auto postfix = TextOf(ctx, ContextKeys::Postfix);
    auto sink = std::back_inserter(out);

    if (auto link = ctx.find(ContextKeys::LinkTo); link != ctx.end() && link->is_number_unsigned())
    {
      fmt::format_to(sink, "{}{} = {} -> #{:016x}\n", indent, title, value, link->get<std::uint64_t>());
      return;
    }

    // Value-only variants: "x = 1", "fn(a, b) #id"
    auto total = ctx.find(ContextKeys::TotalChildren);
    if (total == ctx.end() || !total->is_number())
    {
      if (prefix == "=")
        fmt::format_to(sink, "{}{} = {}\n", indent, title, value);
      else
        fmt::format_to(sink, "{}{}{}{}{}{}\n", indent, title, prefix, value, postfix, IdSuffix(ctx));
      return;
    }

    const auto id = IdSuffix(ctx);
    const auto declared = total->get<NGIN::UIntSize>();
    auto children = ctx.find(ContextKeys::Children);
    if (children == ctx.end() || !children->is_array())
    {
      fmt::format_to(sink, "{}{} {}...{} ({}){}\n", indent, title, prefix, postfix, declared, id);
      return;
    }

    if (children->empty())
    {
      if (declared == 0)
        fmt::format_to(sink, "{}{} {}{}{}\n", indent, title, prefix, postfix, id);
      else
        fmt::format_to(sink, "{}{} {} ... {} more {}{}\n", indent, title, prefix, declared, postfix, id);
      return;
    }

    fmt::format_to(sink, "{}{} {}{}\n", indent, title, prefix, id);
    for (const auto &child : *children)
    {
      if (child.is_object())
        RenderNode(child, level + 1, out);
    }
    if (declared > children->size())
      fmt::format_to(sink, "{}{}... {} more\n", indent, std::string(m_indentWidth, ' '), declared - children->size());
    fmt::format_to(sink, "{}{}\n", indent, postfix);
  }

  std::expected<void, Error> RegisterStyle(std::shared_ptr<const Style> style)
  {
    if (!style)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null style"});
    if (style->Name().empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "style has no name"});
    auto &styles = Styles();
    auto it = std::find_if(styles.begin(), styles.end(),
                           [&](const auto &s) { return s->Name() == style->Name(); });
    if (it != styles.end())
    {
      NGIN_INSPECT_LOG(Debug, kTag, "replacing style '{}'", style->Name());
      *it = std::move(style);
    }
    else
    {
      styles.push_back(std::move(style));
    }
    return {};
  }

  std::expected<std::shared_ptr<const Style>, Error> FindStyle(std::string_view name)
  {
    for (const auto &s : Styles())
      if (s->Name() == name)
        return s;
    return std::unexpected(Error{ErrorCode::NotFound, fmt::format("style '{}' not found", name)});
  }

} // namespace NGIN::Inspect
