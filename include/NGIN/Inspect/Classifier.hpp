// Classifier.hpp
// Turns one value into one Node. Recursion into children goes through a
// ChildHook so that the classifier never owns traversal state.
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Node.hpp>
#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/Types.hpp>
#include <NGIN/Inspect/Value.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace NGIN::Inspect
{

  inline constexpr std::string_view kDuplicatedText = "(duplicated)";

  class ChildHook
  {
  public:
    virtual ~ChildHook() = default;

    // Node for one child with `depth` remaining generations. An error aborts
    // the whole inspection.
    [[nodiscard]] virtual ExpectedNode MakeChild(std::string title, const ValueRef &value, std::int64_t depth) = 0;
    // Breadth budget for Mapping, Sequence and LazyCollection nodes.
    [[nodiscard]] virtual NGIN::UIntSize MaxItems() const noexcept = 0;
    // Keeps a materialised temporary alive until the traversal ends.
    virtual void Retain(std::shared_ptr<const void> owner) = 0;
  };

  // Classifies `value` (indirections resolved) into a Node with `depth`
  // generations budgeted for it and its descendants; children, when
  // expanded, receive depth - 1. Fails with DepthExhausted when depth <= 0.
  NGIN_INSPECT_API ExpectedNode Classify(ChildHook &hook, std::string title, const ValueRef &value, std::int64_t depth);

  // Members of a composite that an inspection shows, in registration order.
  // Excludes static functions, type handles, names starting with '_' and
  // members flagged do_not_call_in_templates (or hidden), on the member itself
  // or on the registered type of its value.
  NGIN_INSPECT_API bool IsVisibleMember(const Member &member);
  NGIN_INSPECT_API NGIN::UIntSize VisibleMemberCount(const Type &type);

  // Substitute node for a value already shown in the current traversal.
  NGIN_INSPECT_API Node MakeDuplicate(std::string title, const ValueRef &value, Identity first);

} // namespace NGIN::Inspect
