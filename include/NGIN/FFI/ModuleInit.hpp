#pragma once

#include <string_view>
#include <type_traits>
#include <utility>

#include <NGIN/FFI/Registry.hpp>
#include <NGIN/Hashing/FNV.hpp>

namespace NGIN::FFI
{

  using ModuleId = NGIN::UInt64;

  /**
   * Handed to extension modules (struct types, buffer types, ...) so they can
   * register their value kinds with attribution to the owning module.
   */
  class ModuleRegistration
  {
  public:
    constexpr explicit ModuleRegistration(std::string_view moduleName) noexcept
        : m_moduleName(moduleName),
          m_moduleId(NGIN::Hashing::FNV1a64(moduleName.data(), moduleName.size()))
    {
    }

    [[nodiscard]] constexpr std::string_view ModuleName() const noexcept
    {
      return m_moduleName;
    }

    [[nodiscard]] constexpr ModuleId GetModuleId() const noexcept
    {
      return m_moduleId;
    }

    /** Register a kind directly beneath FFI::Type. */
    std::expected<KindId, Error> RegisterType(std::string_view kindName) const
    {
      return RegisterKind(kindName, kTypeKind);
    }

    std::expected<KindId, Error> RegisterKind(std::string_view kindName, std::string_view parent) const
    {
      return NGIN::FFI::RegisterKind(kindName, parent);
    }

  private:
    std::string_view m_moduleName;
    ModuleId m_moduleId{0};
  };

  /**
   * Runs `fn` exactly once per call site and only marks it initialized when
   * the callable succeeds. If it returns something convertible to bool, that
   * value decides success. Call during start-up, before worker threads exist.
   */
  template <class Fn>
  bool EnsureModuleInitialized(std::string_view moduleName, Fn &&fn)
  {
    static bool initialized = false;
    if (initialized)
      return true;

    ModuleRegistration registration{moduleName};

    using Result = std::invoke_result_t<Fn, ModuleRegistration &>;

    if constexpr (std::is_void_v<Result>)
    {
      std::forward<Fn>(fn)(registration);
      initialized = true;
      return true;
    }
    else
    {
      Result result = std::forward<Fn>(fn)(registration);
      if constexpr (std::is_convertible_v<Result, bool>)
      {
        if (!static_cast<bool>(result))
          return false;
        initialized = true;
        return true;
      }
      else
      {
        initialized = true;
        return true;
      }
    }
  }

} // namespace NGIN::FFI
