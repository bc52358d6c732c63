#include <NGIN/FFI/Log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace NGIN::FFI::Log
{
  namespace
  {
    std::shared_ptr<spdlog::logger> CreateLogger()
    {
      if (auto existing = spdlog::get(kLoggerName))
        return existing;
      auto logger = spdlog::stdout_color_mt(kLoggerName);
      logger->set_level(spdlog::level::warn);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
      return logger;
    }
  } // namespace

  const std::shared_ptr<spdlog::logger> &Logger()
  {
    static const std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return logger;
  }

  void SetLevel(spdlog::level::level_enum level)
  {
    Logger()->set_level(level);
  }

} // namespace NGIN::FFI::Log
