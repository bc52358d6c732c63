#include <NGIN/FFI/Boundary.hpp>

namespace NGIN::FFI
{
  namespace
  {
    std::optional<Unavailable> CheckSlot(const BoundaryConfig &cfg, NativeType t, NGIN::UIntSize index, bool isReturn)
    {
      switch (t)
      {
        case NativeType::Varargs:
          return Unavailable{UnavailableReason::UnsupportedType, index, "variadic slot"};
        case NativeType::Void:
          if (!isReturn)
            return Unavailable{UnavailableReason::UnsupportedType, index, "void parameter"};
          break;
        case NativeType::Struct:
          if (!cfg.structByValue)
            return Unavailable{UnavailableReason::UnsupportedType, index, "struct by value"};
          break;
        case NativeType::LongDouble:
          if (!cfg.longDouble)
            return Unavailable{UnavailableReason::UnsupportedType, index, "long double"};
          break;
        default:
          break;
      }
      return std::nullopt;
    }
  } // namespace

  std::optional<Unavailable> HostBoundary::Check(const Type &returnType,
                                                 const ParameterList &parameterTypes) const
  {
    if (!m_config.hostSupported)
      return Unavailable{UnavailableReason::UnsupportedPlatform, npos, "no callback trampolines for this target"};

    if (parameterTypes.Size() > m_config.maxArity)
      return Unavailable{UnavailableReason::ArityLimitExceeded, npos, "too many parameters"};

    if (auto u = CheckSlot(m_config, returnType.GetNativeType(), npos, true))
      return u;

    for (NGIN::UIntSize i = 0; i < parameterTypes.Size(); ++i)
    {
      if (auto u = CheckSlot(m_config, parameterTypes[i]->GetNativeType(), i, false))
        return u;
    }
    return std::nullopt;
  }

  const NativeBoundary &DefaultBoundary() noexcept
  {
    static const HostBoundary boundary{};
    return boundary;
  }

} // namespace NGIN::FFI
