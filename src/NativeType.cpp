#include <NGIN/FFI/NativeType.hpp>
#include <NGIN/FFI/Types.hpp>

#include <array>

namespace NGIN::FFI
{
  namespace
  {
    constexpr std::array<std::string_view, kNativeTypeCount> kNames{
        "VOID", "BOOL", "INT8", "UINT8", "INT16", "UINT16", "INT32", "UINT32", "INT64", "UINT64",
        "LONG", "ULONG", "FLOAT32", "FLOAT64", "LONGDOUBLE", "POINTER", "STRING", "STRUCT", "VARARGS",
    };
  } // namespace

  std::string_view NativeTypeName(NativeType t) noexcept
  {
    const auto code = static_cast<NGIN::UInt8>(t);
    if (code >= kNativeTypeCount)
      return {};
    return kNames[code];
  }

  std::optional<NativeType> NativeTypeFromCode(NGIN::UInt8 code) noexcept
  {
    if (code >= kNativeTypeCount)
      return std::nullopt;
    return static_cast<NativeType>(code);
  }

  std::string_view UnavailableReasonName(UnavailableReason r) noexcept
  {
    switch (r)
    {
      case UnavailableReason::UnsupportedPlatform: return "unsupported platform";
      case UnavailableReason::ArityLimitExceeded: return "arity limit exceeded";
      case UnavailableReason::UnsupportedType: return "unsupported type";
      case UnavailableReason::ResourceExhausted: return "resource exhausted";
    }
    return {};
  }

} // namespace NGIN::FFI
