// Types.hpp
// Public-facing error codes, outcome types and shared pointer aliases
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/FFI/Export.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace NGIN::FFI
{

  inline constexpr NGIN::UIntSize npos = static_cast<NGIN::UIntSize>(-1);

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
  };

  // Which argument of a construction request an error refers to.
  enum class ArgumentRole : unsigned char
  {
    None = 0,
    ReturnType = 1,
    ParameterList = 2,
    ParameterElement = 3,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};
    ArgumentRole role{ArgumentRole::None};
    NGIN::UIntSize index{npos};
    std::string actualKind{};
    std::string_view expected{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
    Error(ErrorCode c, std::string m, ArgumentRole r, NGIN::UIntSize i, std::string kind, std::string_view exp)
        : code(c), message(std::move(m)), role(r), index(i), actualKind(std::move(kind)), expected(exp)
    {
    }
  };

  enum class UnavailableReason : unsigned char
  {
    UnsupportedPlatform = 1,
    ArityLimitExceeded = 2,
    UnsupportedType = 3,
    ResourceExhausted = 4,
  };

  [[nodiscard]] NGIN_FFI_API std::string_view UnavailableReasonName(UnavailableReason r) noexcept;

  // The environment cannot represent a signature at the native boundary.
  // `index` is the offending parameter, or npos for the return type / whole signature.
  struct Unavailable
  {
    UnavailableReason reason{UnavailableReason::UnsupportedPlatform};
    NGIN::UIntSize index{npos};
    std::string_view detail{};
  };

  class Value;
  class Type;
  class NativeParam;
  class Sequence;
  class CallbackDescriptor;
  class CallbackOutcome;

  using ValuePtr = std::shared_ptr<const Value>;
  using TypePtr = std::shared_ptr<const Type>;
  using CallbackDescriptorPtr = std::shared_ptr<const CallbackDescriptor>;

  using ExpectedCallback = std::expected<CallbackOutcome, Error>;

} // namespace NGIN::FFI
