// RegistryTests.cpp - type registration and member metadata

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Inspect/Inspect.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace RegistryDemo {
struct Bin {
  std::string code{"B-7"};
  int capacity{40};
  int Free(int used, int reserved) const { return capacity - used - reserved; }
  int Load() const { return 3; }
  static Bin Make() { return {}; }

  friend void NginReflect(NGIN::Inspect::Tag<Bin>, NGIN::Inspect::TypeBuilder<Bin> &b) {
    b.SetName("Demo::Bin");
    b.Attribute("category", std::string_view{"storage"});
    b.Field<&Bin::code>("code");
    b.FieldAttribute<&Bin::code>("max_length", std::int64_t{8});
    b.Field<&Bin::capacity>("capacity");
    b.Property<&Bin::Load>("load");
    b.PropertyAttribute<&Bin::Load>("hidden", false);
    b.Method<&Bin::Free>("free", {"used"});
    b.StaticMethod<&Bin::Make>("make");
  }
};

// Not under our control; described from outside.
struct Label {
  std::string text{"fragile"};
};

struct NeverRegistered {
  int x{0};
};
} // namespace RegistryDemo

namespace NGIN::Inspect {
template <>
struct Describe<RegistryDemo::Label> {
  static void Do(TypeBuilder<RegistryDemo::Label> &b) { b.Field<&RegistryDemo::Label::text>("text"); }
};
} // namespace NGIN::Inspect

TEST_CASE("RegisteredTypeIsFoundByCustomName", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  const Type bin = GetType<RegistryDemo::Bin>();
  REQUIRE(bin.IsValid());
  CHECK(bin.QualifiedName() == "Demo::Bin");
  CHECK(bin.Size() == sizeof(RegistryDemo::Bin));
  CHECK(bin.Alignment() == alignof(RegistryDemo::Bin));

  auto byName = GetType("Demo::Bin");
  REQUIRE(byName.has_value());
  CHECK(byName->GetHandle().index == bin.GetHandle().index);
  CHECK(FindType("Demo::Bin").has_value());
}

TEST_CASE("MissingTypeIsNotFound", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  auto missing = GetType("Demo::Nowhere");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NotFound);
  CHECK_FALSE(FindType("Demo::Nowhere").has_value());
}

TEST_CASE("MembersKeepRegistrationOrderAndKinds", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  const Type bin = GetType<RegistryDemo::Bin>();
  REQUIRE(bin.MemberCount() == 5u);
  CHECK(bin.MemberAt(0).Name() == "code");
  CHECK(bin.MemberAt(1).IsField());
  CHECK(bin.MemberAt(2).IsProperty());
  CHECK(bin.MemberAt(3).IsMethod());
  CHECK(bin.MemberAt(4).IsStaticMethod());

  CHECK(bin.CountOf(MemberKind::Field) == 2u);
  CHECK(bin.CountOf(MemberKind::Property) == 1u);
  CHECK(bin.CountOf(MemberKind::Method) == 1u);
  CHECK(bin.CountOf(MemberKind::StaticMethod) == 1u);
  CHECK(VisibleMemberCount(bin) == 4u);

  auto missing = bin.GetMember("volume");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("MethodParametersArePadded", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  const Type bin = GetType<RegistryDemo::Bin>();
  auto reserve = bin.GetMember("free");
  REQUIRE(reserve.has_value());
  REQUIRE(reserve->ParameterCount() == 2u);
  CHECK(reserve->ParameterAt(0) == "used");
  CHECK(reserve->ParameterAt(1) == "arg1");
}

TEST_CASE("AttributesAreQueryable", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  const Type bin = GetType<RegistryDemo::Bin>();
  auto category = bin.Attribute("category");
  REQUIRE(category.has_value());
  CHECK(std::get<std::string_view>(category->Value()) == "storage");

  auto code = bin.GetMember("code");
  REQUIRE(code.has_value());
  auto maxLength = code->Attribute("max_length");
  REQUIRE(maxLength.has_value());
  CHECK(std::get<std::int64_t>(maxLength->Value()) == 8);
  CHECK_FALSE(code->Attribute("unit").has_value());

  // A false flag does not hide the member.
  auto load = bin.GetMember("load");
  REQUIRE(load.has_value());
  CHECK_FALSE(load->HasFlag("hidden"));
  CHECK(IsVisibleMember(*load));
}

TEST_CASE("FieldReadYieldsMemberValue", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  RegistryDemo::Bin bin{};
  auto capacity = GetType<RegistryDemo::Bin>().GetMember("capacity");
  REQUIRE(capacity.has_value());
  auto value = capacity->Read(&bin);
  REQUIRE(value.has_value());
  CHECK(value->address == &bin.capacity);
  CHECK(value->shape->Text(value->address) == "40");
}

TEST_CASE("MethodReadYieldsAnOwnedSignature", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  RegistryDemo::Bin first{};
  RegistryDemo::Bin second{};
  auto free = GetType<RegistryDemo::Bin>().GetMember("free");
  REQUIRE(free.has_value());
  CHECK(free->ValueShape() == nullptr);

  auto a = free->Read(&first);
  auto b = free->Read(&second);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a->shape->kind == NodeKind::BoundMethod);
  CHECK(a->owner != nullptr);
  CHECK(a->address != static_cast<const void *>(&first));
  CHECK(static_cast<const BoundMethod *>(a->address)->Signature() == "used, arg1");
  CHECK(static_cast<const BoundMethod *>(b->address)->Signature() == "used, arg1");
}

TEST_CASE("FieldValueShapeMatchesDeclaredType", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  auto capacity = GetType<RegistryDemo::Bin>().GetMember("capacity");
  REQUIRE(capacity.has_value());
  CHECK(capacity->ValueShape() == &ShapeOf<int>());
}

TEST_CASE("DescribeSpecializationRegistersExternalType", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  RegistryDemo::Label label{};
  auto node = Inspect("label", label).value();
  CHECK(node.kind == NodeKind::Composite);
  REQUIRE(node.Child("text") != nullptr);
  CHECK(node.Child("text")->valueText == "\"fragile\"");
}

TEST_CASE("TypesRegisterLazily", "[inspect][Registry]") {
  using namespace NGIN::Inspect;
  CHECK_FALSE(TryGetType<RegistryDemo::NeverRegistered>().has_value());
  RegistryDemo::NeverRegistered value{};
  auto node = Inspect("value", value).value();
  CHECK(node.kind == NodeKind::Composite);
  CHECK(node.declaredChildCount == NGIN::UIntSize{0});
  CHECK(TryGetType<RegistryDemo::NeverRegistered>().has_value());
}
