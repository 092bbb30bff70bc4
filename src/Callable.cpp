#include <NGIN/Inspect/Callable.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace NGIN::Inspect
{

  std::string BoundMethod::Signature() const
  {
    return fmt::format("{}", fmt::join(m_parameters, ", "));
  }

  std::vector<Partial::Argument> Partial::Arguments() const
  {
    std::vector<Argument> out;
    out.reserve(m_parameters.size());
    for (NGIN::UIntSize i = 0; i < m_parameters.size(); ++i)
    {
      Argument arg{m_parameters[i], false, std::nullopt};
      if (i < m_positional.size())
      {
        arg.bound = true;
        arg.text = m_positional[i];
      }
      else
      {
        auto it = std::find_if(m_keywords.begin(), m_keywords.end(),
                               [&](const auto &kw) { return kw.first == m_parameters[i]; });
        if (it != m_keywords.end())
        {
          arg.bound = true;
          arg.text = it->second;
        }
      }
      out.push_back(std::move(arg));
    }
    return out;
  }

  std::string Partial::Title(std::string_view name) const
  {
    return fmt::format("{}(...) -> {}", name, m_target);
  }

  std::string Partial::Signature() const
  {
    std::vector<std::string> fragments;
    for (const auto &arg : Arguments())
    {
      if (!arg.bound)
        fragments.push_back(arg.name);
      else if (arg.text)
        fragments.push_back(fmt::format("{}={}", arg.name, *arg.text));
      else
        fragments.push_back(fmt::format("{}={}", arg.name, kComplexText));
    }
    return fmt::format("{}", fmt::join(fragments, ", "));
  }

} // namespace NGIN::Inspect
