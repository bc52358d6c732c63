// NativeType.hpp
// Closed set of native representation categories at the foreign boundary.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/FFI/Export.hpp>

#include <optional>
#include <string_view>

namespace NGIN::FFI
{

  enum class NativeType : NGIN::UInt8
  {
    Void = 0,
    Bool = 1,
    Int8 = 2,
    UInt8 = 3,
    Int16 = 4,
    UInt16 = 5,
    Int32 = 6,
    UInt32 = 7,
    Int64 = 8,
    UInt64 = 9,
    Long = 10,
    ULong = 11,
    Float32 = 12,
    Float64 = 13,
    LongDouble = 14,
    Pointer = 15,
    String = 16,
    Struct = 17,
    Varargs = 18,
  };

  inline constexpr NGIN::UInt8 kNativeTypeCount = 19;

  // Canonical upper-case name, e.g. "INT32". Empty for out-of-range values.
  [[nodiscard]] NGIN_FFI_API std::string_view NativeTypeName(NativeType t) noexcept;

  // Decode a raw code (ABI records carry one byte per slot).
  [[nodiscard]] NGIN_FFI_API std::optional<NativeType> NativeTypeFromCode(NGIN::UInt8 code) noexcept;

  // True for categories that occupy a single native-sized slot.
  [[nodiscard]] constexpr bool IsScalar(NativeType t) noexcept
  {
    return t != NativeType::Void && t != NativeType::Struct && t != NativeType::Varargs;
  }

} // namespace NGIN::FFI
