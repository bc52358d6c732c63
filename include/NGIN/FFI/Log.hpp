// Log.hpp
// Library logger (spdlog). Quiet by default; hosts raise the level when diagnosing.
#pragma once

#include <NGIN/FFI/Export.hpp>

#include <spdlog/spdlog.h>

#include <memory>

namespace NGIN::FFI::Log
{

  inline constexpr const char *kLoggerName = "NGIN.FFI";

  // Named "NGIN.FFI" logger, created on first use with a stdout colour sink at warn.
  // A logger registered under the same name by the host beforehand is used as-is.
  NGIN_FFI_API const std::shared_ptr<spdlog::logger> &Logger();

  NGIN_FFI_API void SetLevel(spdlog::level::level_enum level);

} // namespace NGIN::FFI::Log
