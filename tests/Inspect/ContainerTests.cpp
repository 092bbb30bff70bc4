// ContainerTests.cpp - mappings and sequences with breadth budgets

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Inspect/Inspect.hpp>

#include <array>
#include <deque>
#include <list>
#include <map>
#include <set>
#include <span>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

TEST_CASE("SequenceTruncatesButReportsTrueLength", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::vector<int> values(10, 4);
  auto node = Inspect("values", values, 2, 3).value();
  CHECK(node.kind == NodeKind::Sequence);
  CHECK(node.prefix == std::string_view{"["});
  CHECK(node.postfix == std::string_view{"]"});
  REQUIRE(node.Children() != nullptr);
  CHECK(node.Children()->size() == 3u);
  CHECK(node.declaredChildCount == NGIN::UIntSize{10});
  CHECK(node.children[0].title == "0");
  CHECK(node.children[2].title == "2");
  CHECK(node.children[2].valueText == "4");
}

TEST_CASE("SequenceWithinBudgetIsComplete", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::list<std::string> names{"a", "b"};
  auto node = Inspect("names", names, 2, 5).value();
  REQUIRE(node.Children() != nullptr);
  CHECK(node.children.size() == 2u);
  CHECK(node.declaredChildCount == NGIN::UIntSize{2});
  CHECK(node.children[1].valueText == "\"b\"");
}

TEST_CASE("ZeroItemBudgetExpandsToEmpty", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::deque<int> values{1, 2, 3};
  auto node = Inspect("values", values, 2, 0).value();
  REQUIRE(node.Children() != nullptr);
  CHECK(node.Children()->empty());
  CHECK(node.declaredChildCount == NGIN::UIntSize{3});
}

TEST_CASE("EmptyContainerIsExpandedToEmpty", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::vector<int> values;
  auto node = Inspect("values", values).value();
  REQUIRE(node.Children() != nullptr);
  CHECK(node.Children()->empty());
  CHECK(node.declaredChildCount == NGIN::UIntSize{0});
}

TEST_CASE("MappingKeysBecomeTitlesInIterationOrder", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::map<std::string, int> stock{{"bolt", 4}, {"nut", 9}, {"washer", 1}};
  auto node = Inspect("stock", stock, 2, 2).value();
  CHECK(node.kind == NodeKind::Mapping);
  CHECK(node.prefix == std::string_view{"{"});
  CHECK(node.postfix == std::string_view{"}"});
  REQUIRE(node.Children() != nullptr);
  REQUIRE(node.children.size() == 2u);
  CHECK(node.declaredChildCount == NGIN::UIntSize{3});
  CHECK(node.children[0].title == "bolt");
  CHECK(node.children[0].valueText == "4");
  CHECK(node.children[1].title == "nut");
}

TEST_CASE("NonStringKeysAreCoercedToText", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::map<int, std::string> byId{{7, "seven"}};
  auto node = Inspect("byId", byId).value();
  REQUIRE(node.children.size() == 1u);
  CHECK(node.children[0].title == "7");
  CHECK(node.children[0].valueText == "\"seven\"");

  std::unordered_map<bool, int> flags{{true, 1}};
  auto flagNode = Inspect("flags", flags).value();
  REQUIRE(flagNode.children.size() == 1u);
  CHECK(flagNode.children[0].title == "true");
}

TEST_CASE("DynamicMapKeepsInsertionOrder", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  auto map = Dynamic::MakeMap({{"zeta", 1}, {"alpha", 2}, {"mid", "x"}});
  auto node = Inspect("m", map, 2, 10).value();
  CHECK(node.kind == NodeKind::Mapping);
  REQUIRE(node.children.size() == 3u);
  CHECK(node.children[0].title == "zeta");
  CHECK(node.children[1].title == "alpha");
  CHECK(node.children[2].valueText == "\"x\"");
}

TEST_CASE("FixedSizeAndOrderedSetsAreSequences", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::array<int, 3> fixed{3, 2, 1};
  auto arr = Inspect("fixed", fixed).value();
  CHECK(arr.kind == NodeKind::Sequence);
  CHECK(arr.declaredChildCount == NGIN::UIntSize{3});

  std::set<int> sorted{5, 1, 3};
  auto set = Inspect("sorted", sorted).value();
  CHECK(set.kind == NodeKind::Sequence);
  REQUIRE(set.children.size() == 3u);
  CHECK(set.children[0].valueText == "1");
}

TEST_CASE("TuplesAreSequencesOfTheirElements", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  auto row = std::make_tuple(1, std::string{"two"}, 3.5);
  auto node = Inspect("row", row, 2, 2).value();
  CHECK(node.kind == NodeKind::Sequence);
  CHECK(node.declaredChildCount == NGIN::UIntSize{3});
  REQUIRE(node.children.size() == 2u);
  CHECK(node.children[1].valueText == "\"two\"");
}

TEST_CASE("ProxyElementsAreMaterialised", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::vector<bool> bits{true, false, true};
  auto node = Inspect("bits", bits).value();
  REQUIRE(node.children.size() == 3u);
  CHECK(node.children[0].valueText == "true");
  CHECK(node.children[1].valueText == "false");
}

TEST_CASE("NestedContainersSpendOneDepthPerGeneration", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  std::vector<std::vector<int>> grid{{1, 2}, {3}};
  auto node = Inspect("grid", grid, 1, 5).value();
  REQUIRE(node.children.size() == 2u);
  const Node &row = node.children[0];
  CHECK(row.kind == NodeKind::Sequence);
  CHECK(row.declaredChildCount == NGIN::UIntSize{2});
  CHECK(row.Children() == nullptr);
}

TEST_CASE("NginVectorAndSpanAreSequences", "[inspect][Containers]") {
  using namespace NGIN::Inspect;
  NGIN::Containers::Vector<int> ids;
  ids.PushBack(11);
  ids.PushBack(12);
  auto node = Inspect("ids", ids).value();
  CHECK(node.kind == NodeKind::Sequence);
  REQUIRE(node.children.size() == 2u);
  CHECK(node.children[1].valueText == "12");

  std::vector<int> backing{1, 2, 3, 4};
  std::span<const int> window{backing.data() + 1, 2};
  auto view = Inspect("window", window).value();
  CHECK(view.kind == NodeKind::Sequence);
  CHECK(view.declaredChildCount == NGIN::UIntSize{2});
  CHECK(view.children[0].valueText == "2");
}
