// Value.hpp
// Non-owning references to inspected values and the per-type shape table
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <NGIN/Inspect/Types.hpp>

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

namespace NGIN::Inspect
{

  struct Shape;

  // A view of one value: its address plus the shape table of its static type.
  // `owner` keeps materialised temporaries (getter results, fetched rows) alive.
  struct ValueRef
  {
    const void *address{nullptr};
    const Shape *shape{nullptr};
    std::shared_ptr<const void> owner{};

    [[nodiscard]] bool IsValid() const noexcept { return shape != nullptr; }

    // Follows transparent indirections (pointers, optionals, variants) down to
    // the value that is actually classified.
    [[nodiscard]] ValueRef Resolve() const;

    [[nodiscard]] Identity GetIdentity() const noexcept;
  };

  // Receives the entries of a container during enumeration. Returning false
  // stops the enumeration early.
  class EntryVisitor
  {
  public:
    virtual ~EntryVisitor() = default;
    virtual bool Visit(std::string key, const ValueRef &value) = 0;
  };

  // Static description of how values of one C++ type are inspected. Built once
  // per type by ShapeOf<T>() (Shape.hpp); the kind is fixed at compile time.
  struct Shape
  {
    NodeKind kind{NodeKind::Composite};
    std::string_view typeName{};
    NGIN::UInt64 typeId{0};
    bool quoted{false};
    bool isTypeHandle{false};

    // Scalar
    std::string (*Text)(const void *){nullptr};
    // Transparent indirection; null for every classified shape
    ValueRef (*Unwrap)(const void *){nullptr};
    // Mapping / Sequence / LazyCollection
    NGIN::UIntSize (*Count)(const void *){nullptr};
    void (*Enumerate)(const void *, NGIN::UIntSize limit, EntryVisitor &){nullptr};
    // Composite: registry index of the reflected type (registers on demand)
    NGIN::UInt32 (*TypeIndex)(){nullptr};

    [[nodiscard]] bool IsIndirection() const noexcept { return Unwrap != nullptr; }
  };

  inline ValueRef ValueRef::Resolve() const
  {
    ValueRef current = *this;
    while (current.shape && current.shape->IsIndirection())
    {
      ValueRef next = current.shape->Unwrap(current.address);
      if (!next.owner)
        next.owner = current.owner;
      current = std::move(next);
    }
    return current;
  }

  inline Identity ValueRef::GetIdentity() const noexcept
  {
    const auto addressBits = reinterpret_cast<std::uintptr_t>(address);
    const NGIN::UInt64 typeId = shape ? shape->typeId : 0;
    char bytes[sizeof(addressBits) + sizeof(typeId)];
    std::memcpy(bytes, &addressBits, sizeof(addressBits));
    std::memcpy(bytes + sizeof(addressBits), &typeId, sizeof(typeId));
    return NGIN::Hashing::FNV1a64(bytes, sizeof(bytes));
  }

} // namespace NGIN::Inspect
