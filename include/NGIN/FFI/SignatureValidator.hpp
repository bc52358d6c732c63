// SignatureValidator.hpp
// The single construction path for CallbackDescriptor
#pragma once

#include <NGIN/FFI/Boundary.hpp>
#include <NGIN/FFI/CallbackDescriptor.hpp>
#include <NGIN/FFI/Export.hpp>
#include <NGIN/FFI/Types.hpp>
#include <NGIN/FFI/Value.hpp>

#include <initializer_list>
#include <span>
#include <string_view>

namespace NGIN::FFI
{

  // Capability names used in InvalidArgument diagnostics.
  inline constexpr std::string_view kExpectTypeCapability = "FFI::Type";
  inline constexpr std::string_view kExpectSequenceCapability = "Array";
  inline constexpr std::string_view kExpectTypeElements = "array of FFI::Type";

  /**
   * Validates a candidate return type and candidate parameter list and builds
   * the descriptor. Checks run in order and stop at the first violation:
   *   1. the return candidate is a Type,
   *   2. the parameter candidate is a Sequence (any length),
   *   3. every element is a Type, scanned by index.
   * Shape failures are InvalidArgument errors. A shape-valid signature the
   * boundary cannot represent yields an Unavailable outcome, not an error.
   *
   * Stateless apart from the boundary reference; the boundary must outlive
   * the validator.
   */
  class NGIN_FFI_API SignatureValidator
  {
  public:
    SignatureValidator() noexcept;
    explicit SignatureValidator(const NativeBoundary &boundary) noexcept : m_boundary(&boundary) {}

    [[nodiscard]] ExpectedCallback Validate(const ValuePtr &returnCandidate, const ValuePtr &parameterCandidates) const;

    // Statically typed callers; only a null entry can fail the shape check.
    [[nodiscard]] ExpectedCallback Validate(const TypePtr &returnType, std::span<const TypePtr> parameterTypes) const;
    [[nodiscard]] ExpectedCallback Validate(const TypePtr &returnType, std::initializer_list<TypePtr> parameterTypes) const
    {
      return Validate(returnType, std::span<const TypePtr>{parameterTypes.begin(), parameterTypes.size()});
    }

    [[nodiscard]] const NativeBoundary &Boundary() const noexcept { return *m_boundary; }

  private:
    [[nodiscard]] ExpectedCallback Build(TypePtr returnType, ParameterList parameterTypes) const;

    const NativeBoundary *m_boundary;
  };

  // Validate against DefaultBoundary().
  [[nodiscard]] NGIN_FFI_API ExpectedCallback MakeCallback(const ValuePtr &returnCandidate, const ValuePtr &parameterCandidates);
  [[nodiscard]] NGIN_FFI_API ExpectedCallback MakeCallback(const TypePtr &returnType, std::span<const TypePtr> parameterTypes);
  [[nodiscard]] inline ExpectedCallback MakeCallback(const TypePtr &returnType, std::initializer_list<TypePtr> parameterTypes)
  {
    return MakeCallback(returnType, std::span<const TypePtr>{parameterTypes.begin(), parameterTypes.size()});
  }

} // namespace NGIN::FFI
