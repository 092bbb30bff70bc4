// Node.hpp
// One classified value in an inspection tree
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Inspect/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace NGIN::Inspect
{

  // Built bottom-up by the Manager and immutable once returned.
  //
  // Children have two empty states: not expanded (value-only variants and
  // containers reached without remaining depth, Children() == nullptr) and
  // expanded to nothing (an empty list).
  struct Node
  {
    Identity identity{0};
    NodeKind kind{NodeKind::Scalar};
    std::string title{};
    std::string typeName{};
    std::string valueText{};
    std::string_view prefix{};
    std::string_view postfix{};
    // True size of the underlying container; absent for value-only variants.
    std::optional<NGIN::UIntSize> declaredChildCount{};
    // Duplicate only: identity of the node first shown for this object.
    std::optional<Identity> linkTo{};

    std::vector<Node> children{};
    bool expanded{false};

    [[nodiscard]] const std::vector<Node> *Children() const noexcept { return expanded ? &children : nullptr; }
    [[nodiscard]] bool IsExpanded() const noexcept { return expanded; }

    [[nodiscard]] const Node *Child(std::string_view childTitle) const noexcept
    {
      for (const auto &c : children)
        if (c.title == childTitle)
          return &c;
      return nullptr;
    }
  };

} // namespace NGIN::Inspect
