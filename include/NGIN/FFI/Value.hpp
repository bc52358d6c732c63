// Value.hpp
// Capability interfaces for anything handed to the signature validator
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/FFI/Export.hpp>
#include <NGIN/FFI/NativeType.hpp>
#include <NGIN/FFI/Registry.hpp>
#include <NGIN/FFI/Types.hpp>

#include <initializer_list>
#include <string>
#include <string_view>

namespace NGIN::FFI
{

  /**
   * Root of every value a caller can pass as a return or parameter candidate.
   * Membership in a capability is answered by the As* queries; the validator
   * never inspects concrete classes.
   */
  class NGIN_FFI_API Value
  {
  public:
    virtual ~Value() = default;

    // Registered kind name, used in diagnostics ("FFI::Type::Builtin", "Array", ...).
    [[nodiscard]] virtual std::string_view KindName() const noexcept = 0;

    [[nodiscard]] virtual const Type *AsType() const noexcept { return nullptr; }
    [[nodiscard]] virtual const Sequence *AsSequence() const noexcept { return nullptr; }

  protected:
    Value() = default;
    Value(const Value &) = default;
    Value &operator=(const Value &) = default;
  };

  // Kind reported for a missing (null) candidate.
  inline constexpr std::string_view kNilKind = "nil";

  [[nodiscard]] inline std::string_view KindNameOf(const Value *v) noexcept
  {
    return v ? v->KindName() : kNilKind;
  }

  /** Contract for values transmissible as a single native-sized slot. */
  class NGIN_FFI_API NativeParam
  {
  public:
    virtual ~NativeParam() = default;
    [[nodiscard]] virtual NativeType GetNativeType() const noexcept = 0;
  };

  /** The Type capability. Implementations must be immutable once shared. */
  class NGIN_FFI_API Type : public Value
  {
  public:
    [[nodiscard]] virtual NativeType GetNativeType() const noexcept = 0;

    // Display name. Signature rendering lower-cases it.
    [[nodiscard]] virtual std::string ToString() const = 0;

    [[nodiscard]] virtual const NativeParam *AsNativeParam() const noexcept { return nullptr; }

    [[nodiscard]] const Type *AsType() const noexcept final { return this; }
  };

  // Owned, ordered parameter types of a signature.
  using ParameterList = NGIN::Containers::Vector<TypePtr>;

  /** Ordered, indexable, sized sequence of values. */
  class NGIN_FFI_API Sequence : public Value
  {
  public:
    [[nodiscard]] virtual NGIN::UIntSize Size() const noexcept = 0;
    // Null for an out-of-range index.
    [[nodiscard]] virtual ValuePtr At(NGIN::UIntSize i) const = 0;

    [[nodiscard]] const Sequence *AsSequence() const noexcept final { return this; }
  };

  /** Stock mutable sequence, the usual container for parameter candidates. */
  class NGIN_FFI_API ValueList final : public Sequence
  {
  public:
    ValueList() = default;
    ValueList(std::initializer_list<ValuePtr> values);

    [[nodiscard]] std::string_view KindName() const noexcept override { return kArrayKind; }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept override { return m_values.Size(); }
    [[nodiscard]] ValuePtr At(NGIN::UIntSize i) const override;

    void PushBack(ValuePtr v);
    // Replaces element i; ignored when out of range.
    void Set(NGIN::UIntSize i, ValuePtr v);

  private:
    NGIN::Containers::Vector<ValuePtr> m_values;
  };

  /** Primitive and pointer types that ship with the library. */
  class NGIN_FFI_API BuiltinType final : public Type, public NativeParam
  {
  public:
    explicit BuiltinType(NativeType nativeType) noexcept : m_nativeType(nativeType) {}

    [[nodiscard]] std::string_view KindName() const noexcept override { return kBuiltinKind; }
    [[nodiscard]] NativeType GetNativeType() const noexcept override { return m_nativeType; }
    [[nodiscard]] std::string ToString() const override;
    [[nodiscard]] const NativeParam *AsNativeParam() const noexcept override;

  private:
    NativeType m_nativeType;
  };

  // Shared instance per native type. Null for NativeType::Struct, which has no
  // builtin form (struct layouts belong to their own type implementation).
  [[nodiscard]] NGIN_FFI_API TypePtr GetBuiltinType(NativeType t);

} // namespace NGIN::FFI
