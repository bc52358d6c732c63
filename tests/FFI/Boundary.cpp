// Boundary.cpp — shape-valid signatures the host cannot represent come back
// as Unavailable outcomes, never as errors

#include <catch2/catch_test_macros.hpp>

#include <NGIN/FFI/FFI.hpp>

#include "TestValues.hpp"

#include <vector>

using namespace NGIN::FFI;
using FFITest::Builtin;

namespace
{
  // Boundary that can never represent anything, e.g. a build without trampolines.
  class ExhaustedBoundary final : public NativeBoundary
  {
  public:
    std::optional<Unavailable> Check(const Type &, const ParameterList &) const override
    {
      ++calls;
      return Unavailable{UnavailableReason::ResourceExhausted, npos, "trampoline pool empty"};
    }
    mutable int calls{0};
  };
} // namespace

TEST_CASE("UnsupportedPlatformIsSoftFailure", "[ffi][Boundary]")
{
  BoundaryConfig cfg{};
  cfg.hostSupported = false;
  HostBoundary boundary{cfg};
  SignatureValidator validator{boundary};

  auto result = validator.Validate(Builtin(NativeType::Void), {Builtin(NativeType::Int32)});
  REQUIRE(result.has_value());
  CHECK_FALSE(result->IsAvailable());
  CHECK_FALSE(static_cast<bool>(*result));
  CHECK(result->Descriptor() == nullptr);
  REQUIRE(result->GetUnavailable() != nullptr);
  CHECK(result->GetUnavailable()->reason == UnavailableReason::UnsupportedPlatform);
}

TEST_CASE("ShapeErrorsWinOverUnavailability", "[ffi][Boundary]")
{
  ExhaustedBoundary boundary;
  SignatureValidator validator{boundary};

  auto result = validator.Validate(FFITest::MakeSymbol("x"), std::make_shared<ValueList>());
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().code == ErrorCode::InvalidArgument);
  CHECK(boundary.calls == 0);

  auto soft = validator.Validate(Builtin(NativeType::Void), std::make_shared<ValueList>());
  REQUIRE(soft.has_value());
  REQUIRE(soft->GetUnavailable() != nullptr);
  CHECK(soft->GetUnavailable()->reason == UnavailableReason::ResourceExhausted);
  CHECK(boundary.calls == 1);
}

TEST_CASE("ArityAboveLimitIsUnavailable", "[ffi][Boundary]")
{
  BoundaryConfig cfg{};
  cfg.hostSupported = true;
  cfg.maxArity = 2;
  HostBoundary boundary{cfg};
  SignatureValidator validator{boundary};

  std::vector<TypePtr> two(2, Builtin(NativeType::Int32));
  std::vector<TypePtr> three(3, Builtin(NativeType::Int32));

  auto ok = validator.Validate(Builtin(NativeType::Void), two);
  REQUIRE(ok.has_value());
  CHECK(ok->IsAvailable());

  auto tooMany = validator.Validate(Builtin(NativeType::Void), three);
  REQUIRE(tooMany.has_value());
  REQUIRE(tooMany->GetUnavailable() != nullptr);
  CHECK(tooMany->GetUnavailable()->reason == UnavailableReason::ArityLimitExceeded);
}

TEST_CASE("UnrepresentableSlotsAreUnavailable", "[ffi][Boundary]")
{
  BoundaryConfig cfg{};
  cfg.hostSupported = true;
  cfg.structByValue = false;
  cfg.longDouble = false;
  HostBoundary boundary{cfg};
  SignatureValidator validator{boundary};

  auto varargs = validator.Validate(Builtin(NativeType::Void), {Builtin(NativeType::Int32), Builtin(NativeType::Varargs)});
  REQUIRE(varargs.has_value());
  REQUIRE(varargs->GetUnavailable() != nullptr);
  CHECK(varargs->GetUnavailable()->reason == UnavailableReason::UnsupportedType);
  CHECK(varargs->GetUnavailable()->index == 1);

  auto voidParam = validator.Validate(Builtin(NativeType::Void), {Builtin(NativeType::Void)});
  REQUIRE(voidParam.has_value());
  REQUIRE(voidParam->GetUnavailable() != nullptr);
  CHECK(voidParam->GetUnavailable()->index == 0);

  auto longDouble = validator.Validate(Builtin(NativeType::LongDouble), std::span<const TypePtr>{});
  REQUIRE(longDouble.has_value());
  REQUIRE(longDouble->GetUnavailable() != nullptr);
  CHECK(longDouble->GetUnavailable()->index == npos);

  auto layout = std::make_shared<const FFITest::StructLayout>();
  auto byValue = validator.Validate(Builtin(NativeType::Void), {TypePtr{layout}});
  REQUIRE(byValue.has_value());
  CHECK_FALSE(byValue->IsAvailable());

  cfg.structByValue = true;
  HostBoundary permissive{cfg};
  auto allowed = SignatureValidator{permissive}.Validate(Builtin(NativeType::Void), {TypePtr{layout}});
  REQUIRE(allowed.has_value());
  CHECK(allowed->IsAvailable());
}

TEST_CASE("DefaultBoundaryFollowsBuildConfiguration", "[ffi][Boundary]")
{
  SignatureValidator validator{};
  CHECK(&validator.Boundary() == &DefaultBoundary());

  auto result = validator.Validate(Builtin(NativeType::Void), {Builtin(NativeType::Int32)});
  REQUIRE(result.has_value());
#if NGIN_FFI_HOST_SUPPORTED
  CHECK(result->IsAvailable());
#else
  REQUIRE(result->GetUnavailable() != nullptr);
  CHECK(result->GetUnavailable()->reason == UnavailableReason::UnsupportedPlatform);
#endif
}

TEST_CASE("UnavailableReasonsHaveNames", "[ffi][Boundary]")
{
  CHECK(UnavailableReasonName(UnavailableReason::UnsupportedPlatform) == "unsupported platform");
  CHECK(UnavailableReasonName(UnavailableReason::ArityLimitExceeded) == "arity limit exceeded");
  CHECK(UnavailableReasonName(UnavailableReason::UnsupportedType) == "unsupported type");
  CHECK(UnavailableReasonName(UnavailableReason::ResourceExhausted) == "resource exhausted");
}
