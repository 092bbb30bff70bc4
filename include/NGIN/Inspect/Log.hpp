// Log.hpp
// Opt-in diagnostics. Nothing is formatted unless a sink is installed.
#pragma once

#include <NGIN/Inspect/Export.hpp>

#include <fmt/format.h>

#include <source_location>
#include <string_view>
#include <utility>

namespace NGIN::Inspect
{

  enum class LogLevel : unsigned char
  {
    Debug = 0,
    Warning = 1,
    Error = 2,
  };

  [[nodiscard]] constexpr std::string_view LogLevelName(LogLevel level) noexcept
  {
    switch (level)
    {
      case LogLevel::Debug: return "debug";
      case LogLevel::Warning: return "warning";
      case LogLevel::Error: return "error";
    }
    return "unknown";
  }

  struct LogRecord
  {
    LogLevel level;
    std::string_view tag;
    std::string_view message;
    std::source_location location;
  };

  using LogSink = void (*)(const LogRecord &record, void *user);

  // Installs `sink` process-wide; nullptr disables logging. Returns the previous sink.
  NGIN_INSPECT_API LogSink SetLogSink(LogSink sink, void *user = nullptr) noexcept;
  [[nodiscard]] NGIN_INSPECT_API bool IsLogEnabled() noexcept;

  // Writes "[level] tag: message" lines to stderr.
  NGIN_INSPECT_API void StderrLogSink(const LogRecord &record, void *user);

  namespace detail
  {
    NGIN_INSPECT_API void EmitLog(LogLevel level, std::string_view tag, std::string_view message,
                                  const std::source_location &location) noexcept;

    template <class... Args>
    void Log(LogLevel level, std::string_view tag, const std::source_location &location,
             fmt::format_string<Args...> format, Args &&...args)
    {
      if (!IsLogEnabled())
        return;
      const auto message = fmt::format(format, std::forward<Args>(args)...);
      EmitLog(level, tag, message, location);
    }
  } // namespace detail

} // namespace NGIN::Inspect

#if defined(NGIN_INSPECT_DISABLE_LOG)
#define NGIN_INSPECT_LOG(level, tag, ...) ((void)0)
#else
#define NGIN_INSPECT_LOG(level, tag, ...)                                                                              \
  ::NGIN::Inspect::detail::Log(::NGIN::Inspect::LogLevel::level, tag, std::source_location::current(), __VA_ARGS__)
#endif
