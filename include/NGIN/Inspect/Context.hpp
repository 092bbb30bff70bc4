// Context.hpp
// Projection of a Node tree into the JSON document handed to render styles.
#pragma once

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Node.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace NGIN::Inspect
{

  // Keys keep insertion order so styles see them in a fixed sequence.
  using Context = nlohmann::ordered_json;

  // Context keys, one object per node.
  namespace ContextKeys
  {
    inline constexpr const char *Title = "title";
    inline constexpr const char *Id = "id";
    inline constexpr const char *Type = "type";
    inline constexpr const char *Prefix = "prefix";
    inline constexpr const char *LinkTo = "link_to";
    inline constexpr const char *Value = "value";
    inline constexpr const char *Postfix = "postfix";
    inline constexpr const char *TotalChildren = "total_children";
    inline constexpr const char *InspectType = "inspect_type";
    inline constexpr const char *Children = "children";
    inline constexpr const char *Error = "error";
  } // namespace ContextKeys

  // `id` and `link_to` carry the identity bits as unsigned numbers. `link_to`
  // and `total_children` are null when absent; `children` is null when the
  // node was not expanded and a (possibly empty) array otherwise.
  [[nodiscard]] NGIN_INSPECT_API Context Project(const Node &node);

  // Context for a subject that cannot be inspected: { "error": message }.
  [[nodiscard]] NGIN_INSPECT_API Context MakeErrorContext(std::string_view message);

} // namespace NGIN::Inspect
