/// @file BasicTests.cpp
/// @brief Smoke tests for NGIN.Inspect.

#include <catch2/catch_test_macros.hpp>
#include <NGIN/Inspect/Inspect.hpp>

#include <string_view>

TEST_CASE("LibraryNameReturnsModuleIdentifier", "[inspect][Basics]") {
  CHECK(NGIN::Inspect::LibraryName() == std::string_view{"NGIN.Inspect"});
}

TEST_CASE("DefaultOptionsMatchConservativeBudgets", "[inspect][Basics]") {
  NGIN::Inspect::Manager manager;
  CHECK(manager.Options().maxDepth == 2u);
  CHECK(manager.Options().maxItems == 5u);
}

TEST_CASE("KindNamesAreStable", "[inspect][Basics]") {
  using namespace NGIN::Inspect;
  CHECK(KindName(NodeKind::Mapping) == std::string_view{"Mapping"});
  CHECK(KindName(NodeKind::Duplicate) == std::string_view{"Duplicate"});
  CHECK(KindName(NodeKind::LazyCollection) == std::string_view{"LazyCollection"});
}
