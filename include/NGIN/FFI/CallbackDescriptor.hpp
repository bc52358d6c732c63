// CallbackDescriptor.hpp
// Immutable description of a native callback signature (parameters + return type)
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/FFI/Export.hpp>
#include <NGIN/FFI/Types.hpp>
#include <NGIN/FFI/Value.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace NGIN::FFI
{

  /**
   * A validated callback signature. Only SignatureValidator creates instances,
   * so every descriptor that exists is complete: return type and parameters
   * satisfied the Type capability and the parameter list is a private copy.
   * Holds no mutable state; concurrent reads need no synchronization.
   *
   * A descriptor is itself a Type (passed natively as a function pointer), so
   * it can appear inside another signature.
   */
  class NGIN_FFI_API CallbackDescriptor final : public Type, public NativeParam
  {
  public:
    static constexpr std::string_view kKindName = kCallbackKind;

    [[nodiscard]] const TypePtr &GetReturnType() const noexcept { return m_returnType; }
    [[nodiscard]] const ParameterList &GetParameterTypes() const noexcept { return m_parameterTypes; }
    [[nodiscard]] TypePtr GetParameterType(NGIN::UIntSize i) const;
    [[nodiscard]] NGIN::UIntSize GetArity() const noexcept { return m_arity; }

    // A callback crosses the boundary as a function pointer.
    [[nodiscard]] NativeType GetNativeType() const noexcept override { return NativeType::Pointer; }
    [[nodiscard]] const NativeParam *AsNativeParam() const noexcept override { return this; }
    [[nodiscard]] std::string_view KindName() const noexcept override { return kKindName; }

    // "[ int32, pointer ], void". Comparison tooling depends on this exact form.
    [[nodiscard]] std::string Render() const;
    // "#<FFI::CallbackInfo [ int32, pointer ], void>"
    [[nodiscard]] std::string Inspect() const;
    // "CallbackInfo[parameters=[int32, pointer] return=void]"
    [[nodiscard]] std::string ToString() const override;

  private:
    friend class SignatureValidator;

    CallbackDescriptor(TypePtr returnType, ParameterList parameterTypes);

    TypePtr m_returnType;
    ParameterList m_parameterTypes;
    NGIN::UIntSize m_arity{0};
  };

  /**
   * Result of a successful shape validation: either the descriptor, or an
   * explicit statement that this host cannot represent the signature.
   */
  class NGIN_FFI_API CallbackOutcome
  {
  public:
    CallbackOutcome(CallbackDescriptorPtr descriptor) : m_value(std::move(descriptor)) {}
    CallbackOutcome(Unavailable unavailable) : m_value(unavailable) {}

    [[nodiscard]] bool IsAvailable() const noexcept { return std::holds_alternative<CallbackDescriptorPtr>(m_value); }
    explicit operator bool() const noexcept { return IsAvailable(); }

    // Null when unavailable.
    [[nodiscard]] CallbackDescriptorPtr Descriptor() const noexcept
    {
      if (auto *p = std::get_if<CallbackDescriptorPtr>(&m_value))
        return *p;
      return nullptr;
    }

    // Null when available.
    [[nodiscard]] const Unavailable *GetUnavailable() const noexcept { return std::get_if<Unavailable>(&m_value); }

  private:
    std::variant<CallbackDescriptorPtr, Unavailable> m_value;
  };

} // namespace NGIN::FFI
