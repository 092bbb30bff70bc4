#pragma once

#include <string_view>

#include <NGIN/Inspect/Types.hpp>
#include <NGIN/Inspect/Value.hpp>
#include <NGIN/Inspect/Scalar.hpp>
#include <NGIN/Inspect/Callable.hpp>
#include <NGIN/Inspect/Lazy.hpp>
#include <NGIN/Inspect/Dynamic.hpp>
#include <NGIN/Inspect/Registry.hpp>
#include <NGIN/Inspect/Shape.hpp>
#include <NGIN/Inspect/TypeBuilder.hpp>
#include <NGIN/Inspect/Node.hpp>
#include <NGIN/Inspect/Classifier.hpp>
#include <NGIN/Inspect/Manager.hpp>
#include <NGIN/Inspect/Context.hpp>
#include <NGIN/Inspect/Style.hpp>
#include <NGIN/Inspect/Log.hpp>

namespace NGIN::Inspect
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Inspect"; }

} // namespace NGIN::Inspect
