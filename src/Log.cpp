#include <NGIN/Inspect/Log.hpp>

#include <fmt/format.h>

#include <cstdio>

namespace NGIN::Inspect
{

  namespace
  {
    LogSink g_sink{nullptr};
    void *g_user{nullptr};
  } // namespace

  LogSink SetLogSink(LogSink sink, void *user) noexcept
  {
    auto previous = g_sink;
    g_sink = sink;
    g_user = user;
    return previous;
  }

  bool IsLogEnabled() noexcept
  {
    return g_sink != nullptr;
  }

  void StderrLogSink(const LogRecord &record, void *)
  {
    fmt::print(stderr, "[{}] {}: {} ({}:{})\n", LogLevelName(record.level), record.tag, record.message,
               record.location.file_name(), record.location.line());
  }

  namespace detail
  {
    void EmitLog(LogLevel level, std::string_view tag, std::string_view message,
                 const std::source_location &location) noexcept
    {
      if (g_sink)
        g_sink(LogRecord{level, tag, message, location}, g_user);
    }
  } // namespace detail

} // namespace NGIN::Inspect
