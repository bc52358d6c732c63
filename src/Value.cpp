#include <NGIN/FFI/Value.hpp>

#include <array>
#include <utility>

namespace NGIN::FFI
{

  ValueList::ValueList(std::initializer_list<ValuePtr> values)
  {
    m_values.Reserve(values.size());
    for (const auto &v : values)
      m_values.PushBack(v);
  }

  ValuePtr ValueList::At(NGIN::UIntSize i) const
  {
    if (i >= m_values.Size())
      return nullptr;
    return m_values[i];
  }

  void ValueList::PushBack(ValuePtr v)
  {
    m_values.PushBack(std::move(v));
  }

  void ValueList::Set(NGIN::UIntSize i, ValuePtr v)
  {
    if (i >= m_values.Size())
      return;
    m_values[i] = std::move(v);
  }

  std::string BuiltinType::ToString() const
  {
    return std::string{NativeTypeName(m_nativeType)};
  }

  const NativeParam *BuiltinType::AsNativeParam() const noexcept
  {
    if (!IsScalar(m_nativeType))
      return nullptr;
    return this;
  }

  TypePtr GetBuiltinType(NativeType t)
  {
    // Built once, never mutated afterwards; safe to hand out across threads.
    static const std::array<TypePtr, kNativeTypeCount> table = []
    {
      std::array<TypePtr, kNativeTypeCount> out{};
      for (NGIN::UInt8 code = 0; code < kNativeTypeCount; ++code)
      {
        const auto nt = static_cast<NativeType>(code);
        if (nt != NativeType::Struct)
          out[code] = std::make_shared<const BuiltinType>(nt);
      }
      return out;
    }();

    const auto code = static_cast<NGIN::UInt8>(t);
    if (code >= kNativeTypeCount)
      return nullptr;
    return table[code];
  }

} // namespace NGIN::FFI
