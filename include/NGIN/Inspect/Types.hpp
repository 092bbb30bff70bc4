// Types.hpp
// Public-facing error codes, node kinds and small handle types
#pragma once

#include <NGIN/Primitives.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace NGIN::Inspect
{

  // Value-independent handle for one inspected object (address + type id).
  using Identity = NGIN::UInt64;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    DepthExhausted = 3,
    AccessFailed = 4,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
  };

  // Display variants, in classification priority order. Duplicate is never
  // chosen by the classifier; the traversal substitutes it on revisits.
  enum class NodeKind : NGIN::UInt8
  {
    Scalar = 0,
    BoundMethod = 1,
    PartialCall = 2,
    Mapping = 3,
    Sequence = 4,
    LazyCollection = 5,
    Composite = 6,
    Duplicate = 7,
  };

  [[nodiscard]] constexpr std::string_view KindName(NodeKind kind) noexcept
  {
    switch (kind)
    {
      case NodeKind::Scalar: return "Scalar";
      case NodeKind::BoundMethod: return "BoundMethod";
      case NodeKind::PartialCall: return "PartialCall";
      case NodeKind::Mapping: return "Mapping";
      case NodeKind::Sequence: return "Sequence";
      case NodeKind::LazyCollection: return "LazyCollection";
      case NodeKind::Composite: return "Composite";
      case NodeKind::Duplicate: return "Duplicate";
    }
    return "Unknown";
  }

  enum class MemberKind : unsigned char
  {
    Field = 0,
    Property = 1,
    Method = 2,
    StaticMethod = 3,
  };

  // Small opaque handles (indices into the registry tables).
  struct TypeHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  struct MemberHandle
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 memberIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && memberIndex != static_cast<NGIN::UInt32>(-1); }
  };

  // Forward decls of high-level wrappers
  class Type;
  class Member;
  class AttributeView;
  struct Node;

  using ExpectedType = std::expected<Type, Error>;
  using ExpectedMember = std::expected<Member, Error>;
  using ExpectedNode = std::expected<Node, Error>;

} // namespace NGIN::Inspect
