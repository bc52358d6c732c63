// Boundary.hpp
// Decides whether a shape-valid signature can be represented natively on this host
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/FFI/Config.hpp>
#include <NGIN/FFI/Export.hpp>
#include <NGIN/FFI/Types.hpp>
#include <NGIN/FFI/Value.hpp>

#include <optional>

namespace NGIN::FFI
{

  class NGIN_FFI_API NativeBoundary
  {
  public:
    virtual ~NativeBoundary() = default;

    // nullopt when the signature is representable.
    [[nodiscard]] virtual std::optional<Unavailable> Check(const Type &returnType,
                                                           const ParameterList &parameterTypes) const = 0;
  };

  struct BoundaryConfig
  {
    bool hostSupported{NGIN_FFI_HOST_SUPPORTED != 0};
    NGIN::UIntSize maxArity{NGIN_FFI_MAX_CALLBACK_ARITY};
    bool structByValue{NGIN_FFI_ENABLE_STRUCT_BY_VALUE != 0};
    bool longDouble{NGIN_FFI_ENABLE_LONG_DOUBLE != 0};
  };

  /** Boundary rules of the current build target, adjustable through BoundaryConfig. */
  class NGIN_FFI_API HostBoundary final : public NativeBoundary
  {
  public:
    HostBoundary() = default;
    explicit HostBoundary(const BoundaryConfig &config) : m_config(config) {}

    [[nodiscard]] std::optional<Unavailable> Check(const Type &returnType,
                                                   const ParameterList &parameterTypes) const override;

    [[nodiscard]] const BoundaryConfig &Config() const noexcept { return m_config; }

  private:
    BoundaryConfig m_config{};
  };

  // Process-wide HostBoundary with the build defaults.
  [[nodiscard]] NGIN_FFI_API const NativeBoundary &DefaultBoundary() noexcept;

} // namespace NGIN::FFI
