// Registry.hpp
// Process-wide table of value kinds and their parent kinds
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/FFI/Export.hpp>
#include <NGIN/FFI/Types.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace NGIN::FFI
{
  using KindId = NGIN::UInt64;

  inline constexpr std::string_view kTypeKind = "FFI::Type";
  inline constexpr std::string_view kBuiltinKind = "FFI::Type::Builtin";
  inline constexpr std::string_view kCallbackKind = "FFI::CallbackInfo";
  inline constexpr std::string_view kArrayKind = "Array";

  struct KindDesc
  {
    std::string name;
    KindId id{0};
    KindId parentId{0}; // 0 for roots
  };

  [[nodiscard]] inline KindId KindIdOf(std::string_view name) noexcept
  {
    return NGIN::Hashing::FNV1a64(name.data(), name.size());
  }

  namespace detail
  {
    struct Registry
    {
      NGIN::Containers::Vector<KindDesc> kinds;
      NGIN::Containers::FlatHashMap<KindId, NGIN::UInt32> byId;
    };

    // The first call registers the library's own kinds.
    NGIN_FFI_API Registry &GetRegistry() noexcept;
  } // namespace detail

  // Register `name` under `parent` (empty for a root kind). Re-registering with
  // the same parent is a no-op; a different or unknown parent is rejected.
  NGIN_FFI_API std::expected<KindId, Error> RegisterKind(std::string_view name, std::string_view parent = {});

  [[nodiscard]] NGIN_FFI_API std::optional<KindDesc> FindKind(std::string_view name);
  [[nodiscard]] NGIN_FFI_API std::expected<KindDesc, Error> GetKind(std::string_view name);

  // True when `name` is `ancestor` or registered beneath it.
  [[nodiscard]] NGIN_FFI_API bool IsKindOf(std::string_view name, std::string_view ancestor) noexcept;

  [[nodiscard]] NGIN_FFI_API NGIN::UIntSize KindCount() noexcept;

} // namespace NGIN::FFI
