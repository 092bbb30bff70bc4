// DepthTests.cpp - generation budget below the root

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Inspect/Inspect.hpp>

#include <memory>
#include <string>
#include <vector>

namespace DepthDemo {
NGIN::Inspect::Dynamic::MapPtr NestedMap() {
  using namespace NGIN::Inspect;
  return Dynamic::MakeMap({{"a", 1}, {"b", Dynamic::MakeMap({{"c", 2}, {"d", 3}})}});
}

// Classifies children directly, without a visited-set.
class PlainHook final : public NGIN::Inspect::ChildHook {
public:
  NGIN::Inspect::ExpectedNode MakeChild(std::string title, const NGIN::Inspect::ValueRef &value,
                                        std::int64_t depth) override {
    return NGIN::Inspect::Classify(*this, std::move(title), value, depth);
  }
  NGIN::UIntSize MaxItems() const noexcept override { return 10; }
  void Retain(std::shared_ptr<const void> owner) override { retained.push_back(std::move(owner)); }

  std::vector<std::shared_ptr<const void>> retained;
};
} // namespace DepthDemo

TEST_CASE("TwoGenerationsExpandNestedMap", "[inspect][Depth]") {
  using namespace NGIN::Inspect;
  auto data = DepthDemo::NestedMap();
  auto node = Inspect("root", data, 2, 10).value();
  REQUIRE(node.Children() != nullptr);
  REQUIRE(node.children.size() == 2u);
  CHECK(node.children[0].title == "a");
  CHECK(node.children[0].valueText == "1");
  const Node &b = node.children[1];
  CHECK(b.kind == NodeKind::Mapping);
  REQUIRE(b.Children() != nullptr);
  REQUIRE(b.children.size() == 2u);
  CHECK(b.children[0].title == "c");
  CHECK(b.children[1].valueText == "3");
}

TEST_CASE("OneGenerationLeavesGrandchildrenUnexpanded", "[inspect][Depth]") {
  using namespace NGIN::Inspect;
  auto data = DepthDemo::NestedMap();
  auto node = Inspect("root", data, 1, 10).value();
  REQUIRE(node.Children() != nullptr);
  const Node *b = node.Child("b");
  REQUIRE(b != nullptr);
  CHECK(b->kind == NodeKind::Mapping);
  CHECK(b->Children() == nullptr);
  CHECK_FALSE(b->IsExpanded());
  CHECK(b->declaredChildCount == NGIN::UIntSize{2});
  CHECK(node.Child("a")->valueText == "1");
}

TEST_CASE("ZeroDepthShowsOnlyTheRoot", "[inspect][Depth]") {
  using namespace NGIN::Inspect;
  auto data = DepthDemo::NestedMap();
  auto node = Inspect("root", data, 0, 10).value();
  CHECK(node.kind == NodeKind::Mapping);
  CHECK(node.Children() == nullptr);
  CHECK(node.declaredChildCount == NGIN::UIntSize{2});

  auto scalar = Inspect("n", 42, 0).value();
  CHECK(scalar.valueText == "42");
}

TEST_CASE("DeeperBudgetNeverShowsLess", "[inspect][Depth]") {
  using namespace NGIN::Inspect;
  std::vector<std::vector<std::vector<int>>> cube{{{1, 2}, {3}}, {{4}}};

  auto countNodes = [](const Node &root) {
    NGIN::UIntSize total = 0;
    std::vector<const Node *> pending{&root};
    while (!pending.empty())
    {
      const Node *n = pending.back();
      pending.pop_back();
      ++total;
      for (const auto &c : n->children)
        pending.push_back(&c);
    }
    return total;
  };

  NGIN::UIntSize previous = 0;
  for (NGIN::UInt32 depth = 0; depth <= 4; ++depth)
  {
    INFO("depth " << depth);
    auto node = Inspect("cube", cube, depth, 10).value();
    const auto count = countNodes(node);
    CHECK(count >= previous);
    previous = count;
  }
  CHECK(previous == 10u);
}

TEST_CASE("ClassifyRejectsExhaustedDepth", "[inspect][Depth]") {
  using namespace NGIN::Inspect;
  DepthDemo::PlainHook hook;
  const int value = 7;

  auto node = Classify(hook, "v", MakeValueRef(value), 0);
  REQUIRE_FALSE(node.has_value());
  CHECK(node.error().code == ErrorCode::DepthExhausted);

  auto leaf = Classify(hook, "v", MakeValueRef(value), 1);
  REQUIRE(leaf.has_value());
  CHECK(leaf->valueText == "7");
}

TEST_CASE("ClassifyWithOneGenerationDoesNotExpand", "[inspect][Depth]") {
  using namespace NGIN::Inspect;
  DepthDemo::PlainHook hook;
  std::vector<int> values{1, 2, 3};

  auto shallow = Classify(hook, "v", MakeValueRef(values), 1);
  REQUIRE(shallow.has_value());
  CHECK(shallow->Children() == nullptr);
  CHECK(shallow->declaredChildCount == NGIN::UIntSize{3});

  auto expanded = Classify(hook, "v", MakeValueRef(values), 2);
  REQUIRE(expanded.has_value());
  REQUIRE(expanded->Children() != nullptr);
  CHECK(expanded->children.size() == 3u);
}
