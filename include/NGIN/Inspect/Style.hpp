// Style.hpp
// Render boundary: named styles turning a projected context into text.
#pragma once

#include <NGIN/Inspect/Context.hpp>
#include <NGIN/Inspect/Export.hpp>
#include <NGIN/Inspect/Types.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace NGIN::Inspect
{

  class NGIN_INSPECT_API Style
  {
  public:
    virtual ~Style() = default;

    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
    // `context` is the output of Project().
    [[nodiscard]] virtual std::string Render(const Context &context) const = 0;
  };

  // Indented plain text, registered as "text". Every non-scalar line ends in
  // its node id so that duplicate links can be followed.
  //
  //   part { #5f1c0a3e9b2d4471
  //     name = "M3 bolt"
  //     stock [ #09a7c1d2e3f40516
  //       0 = 4
  //       ... 7 more
  //     ]
  //     price(currency) #77b0e1f2a3c4d5e6
  //     parent = (duplicated) -> #5f1c0a3e9b2d4471
  //   }
  class NGIN_INSPECT_API TextStyle final : public Style
  {
  public:
    explicit TextStyle(NGIN::UIntSize indentWidth = 2) : m_indentWidth(indentWidth) {}

    [[nodiscard]] std::string_view Name() const noexcept override { return "text"; }
    [[nodiscard]] std::string Render(const Context &context) const override;

  private:
    void RenderNode(const Context &context, NGIN::UIntSize level, std::string &out) const;

    NGIN::UIntSize m_indentWidth;
  };

  // Adds or replaces a style under its Name(). Fails for null or unnamed styles.
  NGIN_INSPECT_API std::expected<void, Error> RegisterStyle(std::shared_ptr<const Style> style);
  NGIN_INSPECT_API std::expected<std::shared_ptr<const Style>, Error> FindStyle(std::string_view name);

} // namespace NGIN::Inspect
