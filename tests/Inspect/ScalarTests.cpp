// ScalarTests.cpp - scalar text, quoting and masking

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Inspect/Inspect.hpp>

#include <fmt/format.h>

#include <chrono>
#include <complex>
#include <cstdint>
#include <optional>
#include <string>

namespace ScalarDemo {
struct Money {
  long long cents{0};
};

enum class Grade : int { A = 1, B = 2 };
} // namespace ScalarDemo

namespace NGIN::Inspect {
template <>
struct ScalarFormatter<ScalarDemo::Money> {
  static std::string Format(const ScalarDemo::Money &m) { return fmt::format("{}.{:02}", m.cents / 100, m.cents % 100); }
};
} // namespace NGIN::Inspect

namespace {
std::string TextOf(const NGIN::Inspect::ExpectedNode &node) {
  REQUIRE(node.has_value());
  CHECK(node->kind == NGIN::Inspect::NodeKind::Scalar);
  return node->valueText;
}
} // namespace

TEST_CASE("NumbersAndBoolsAreUnquoted", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  CHECK(TextOf(Inspect("n", 42)) == "42");
  CHECK(TextOf(Inspect("n", std::int8_t{-3})) == "-3");
  CHECK(TextOf(Inspect("x", 1.5)) == "1.5");
  CHECK(TextOf(Inspect("flag", true)) == "true");
  CHECK(TextOf(Inspect("grade", ScalarDemo::Grade::B)) == "2");
}

TEST_CASE("TextIsDoubleQuoted", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  CHECK(TextOf(Inspect("name", std::string{"M3 bolt"})) == "\"M3 bolt\"");
  CHECK(TextOf(Inspect("name", std::string_view{"nut"})) == "\"nut\"");
  CHECK(TextOf(Inspect("name", "washer")) == "\"washer\"");
  CHECK(TextOf(Inspect("c", 'x')) == "\"x\"");
}

TEST_CASE("WideCharactersAreQuotedUtf8", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  CHECK(TextOf(Inspect("c", U'\u00e9')) == "\"\xC3\xA9\"");
  CHECK(TextOf(Inspect("c", u8'a')) == "\"a\"");
  CHECK(TextOf(Inspect("c", u'\u20ac')) == "\"\xE2\x82\xAC\"");
  CHECK(TextOf(Inspect("c", L'z')) == "\"z\"");
  CHECK(Inspect("c", U'\U0001F600').value().kind == NodeKind::Scalar);
  CHECK(detail::EncodeUtf8(U'\U0001F600') == "\xF0\x9F\x98\x80");
  CHECK(detail::EncodeUtf8(static_cast<char32_t>(0xD800)) == "\xEF\xBF\xBD");
}

TEST_CASE("ScalarNodesUseAssignmentPrefixAndNoChildren", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  auto node = Inspect("n", 7).value();
  CHECK(node.prefix == std::string_view{"="});
  CHECK(node.postfix.empty());
  CHECK_FALSE(node.declaredChildCount.has_value());
  CHECK(node.Children() == nullptr);
  CHECK_FALSE(node.linkTo.has_value());
}

TEST_CASE("ComplexAndDateFormatting", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  using namespace std::chrono;
  CHECK(TextOf(Inspect("z", std::complex<double>{1.0, 2.0})) == "(1+2i)");
  CHECK(TextOf(Inspect("z", std::complex<double>{1.0, -0.5})) == "(1-0.5i)");
  CHECK(TextOf(Inspect("when", year_month_day{year{2024}, month{3}, day{5}})) == "2024-03-05");
}

TEST_CASE("CustomFormatterOptsIntoScalar", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  CHECK(ScalarType<ScalarDemo::Money>);
  CHECK_FALSE(IsQuotedScalar<ScalarDemo::Money>());
  CHECK(TextOf(Inspect("price", ScalarDemo::Money{1234})) == "12.34");
}

TEST_CASE("NullLikeValuesRenderNull", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  int *none = nullptr;
  CHECK(TextOf(Inspect("p", none)) == "null");
  CHECK(TextOf(Inspect("o", std::optional<int>{})) == "null");
  CHECK(TextOf(Inspect("o", std::optional<int>{3})) == "3");
  int value = 9;
  int *some = &value;
  CHECK(TextOf(Inspect("p", some)) == "9");
}

TEST_CASE("PasswordFieldsAreMasked", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  CHECK(TextOf(Inspect("password", std::string{"hunter2"})) == "\"*******\"");
  CHECK(TextOf(Inspect("DB_PASSWORD_HASH", std::string{"abc"})) == "\"***\"");
  CHECK(TextOf(Inspect("userPassword", 1234)) == "\"****\"");
  // Masks characters, not bytes
  CHECK(TextOf(Inspect("password", std::string{"h\xC3\xA9llo"})) == "\"*****\"");
  CHECK(TextOf(Inspect("pass", std::string{"abc"})) == "\"abc\"");
}

TEST_CASE("MaskAndQuoteHelpers", "[inspect][Scalar]") {
  using namespace NGIN::Inspect;
  CHECK(detail::Quote("") == "\"\"");
  CHECK(detail::Mask("") == "\"\"");
  CHECK(detail::Mask("secret") == "\"******\"");
  CHECK(detail::IsSecretName("old_PassWord"));
  CHECK_FALSE(detail::IsSecretName("passwd"));
  CHECK(detail::CodePointCount("\xE2\x82\xAC" "5") == 2u);
}
