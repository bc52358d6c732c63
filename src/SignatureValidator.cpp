#include <NGIN/FFI/SignatureValidator.hpp>
#include <NGIN/FFI/Log.hpp>

#include <new>
#include <string>
#include <utility>

namespace NGIN::FFI
{
  namespace
  {
    Error ShapeError(ArgumentRole role, NGIN::UIntSize index, std::string_view kind, std::string_view expected)
    {
      std::string msg{"wrong argument type "};
      msg += kind;
      switch (role)
      {
        case ArgumentRole::ReturnType:
          msg += " for return type";
          break;
        case ArgumentRole::ParameterList:
          msg += " for parameter types";
          break;
        case ArgumentRole::ParameterElement:
          msg += " at parameter ";
          msg += std::to_string(index);
          break;
        case ArgumentRole::None:
          break;
      }
      msg += " (expected ";
      msg += expected;
      msg += ')';
      return Error{ErrorCode::InvalidArgument, std::move(msg), role, index, std::string{kind}, expected};
    }

    ExpectedCallback Reject(Error err)
    {
      Log::Logger()->debug("callback signature rejected: {}", err.message);
      return std::unexpected(std::move(err));
    }

    CallbackOutcome Exhausted()
    {
      Log::Logger()->warn("callback signature unavailable: out of memory while building descriptor");
      return Unavailable{UnavailableReason::ResourceExhausted, npos, "allocation failed"};
    }
  } // namespace

  SignatureValidator::SignatureValidator() noexcept
      : m_boundary(&DefaultBoundary())
  {
  }

  ExpectedCallback SignatureValidator::Validate(const ValuePtr &returnCandidate, const ValuePtr &parameterCandidates) const
  {
    try
    {
      const Type *returnType = returnCandidate ? returnCandidate->AsType() : nullptr;
      if (!returnType)
        return Reject(ShapeError(ArgumentRole::ReturnType, npos, KindNameOf(returnCandidate.get()), kExpectTypeCapability));

      const Sequence *sequence = parameterCandidates ? parameterCandidates->AsSequence() : nullptr;
      if (!sequence)
        return Reject(ShapeError(ArgumentRole::ParameterList, npos, KindNameOf(parameterCandidates.get()), kExpectSequenceCapability));

      const NGIN::UIntSize count = sequence->Size();
      ParameterList snapshot;
      snapshot.Reserve(count);
      for (NGIN::UIntSize i = 0; i < count; ++i)
      {
        ValuePtr element = sequence->At(i);
        const Type *t = element ? element->AsType() : nullptr;
        if (!t)
          return Reject(ShapeError(ArgumentRole::ParameterElement, i, KindNameOf(element.get()), kExpectTypeElements));
        // Aliasing constructor: shares ownership with the candidate value.
        snapshot.PushBack(TypePtr{std::move(element), t});
      }
      return Build(TypePtr{returnCandidate, returnType}, std::move(snapshot));
    }
    catch (const std::bad_alloc &)
    {
      return Exhausted();
    }
  }

  ExpectedCallback SignatureValidator::Validate(const TypePtr &returnType, std::span<const TypePtr> parameterTypes) const
  {
    try
    {
      if (!returnType)
        return Reject(ShapeError(ArgumentRole::ReturnType, npos, kNilKind, kExpectTypeCapability));

      ParameterList snapshot;
      snapshot.Reserve(parameterTypes.size());
      for (NGIN::UIntSize i = 0; i < parameterTypes.size(); ++i)
      {
        if (!parameterTypes[i])
          return Reject(ShapeError(ArgumentRole::ParameterElement, i, kNilKind, kExpectTypeElements));
        snapshot.PushBack(parameterTypes[i]);
      }
      return Build(returnType, std::move(snapshot));
    }
    catch (const std::bad_alloc &)
    {
      return Exhausted();
    }
  }

  ExpectedCallback SignatureValidator::Build(TypePtr returnType, ParameterList parameterTypes) const
  {
    if (auto unavailable = m_boundary->Check(*returnType, parameterTypes))
    {
      Log::Logger()->info("callback signature unavailable: {} ({})",
                          UnavailableReasonName(unavailable->reason), unavailable->detail);
      return CallbackOutcome{*unavailable};
    }

    CallbackDescriptorPtr descriptor{new CallbackDescriptor(std::move(returnType), std::move(parameterTypes))};
    if (Log::Logger()->should_log(spdlog::level::trace))
      Log::Logger()->trace("callback descriptor built: {}", descriptor->Render());
    return CallbackOutcome{std::move(descriptor)};
  }

  ExpectedCallback MakeCallback(const ValuePtr &returnCandidate, const ValuePtr &parameterCandidates)
  {
    return SignatureValidator{}.Validate(returnCandidate, parameterCandidates);
  }

  ExpectedCallback MakeCallback(const TypePtr &returnType, std::span<const TypePtr> parameterTypes)
  {
    return SignatureValidator{}.Validate(returnType, parameterTypes);
  }

} // namespace NGIN::FFI
