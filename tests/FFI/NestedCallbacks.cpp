// NestedCallbacks.cpp — a descriptor is a Type and can sit inside another signature

#include <catch2/catch_test_macros.hpp>

#include <NGIN/FFI/FFI.hpp>

#include "TestValues.hpp"

using namespace NGIN::FFI;
using FFITest::Builtin;
using FFITest::Descriptor;

TEST_CASE("DescriptorReportsPointerCategory", "[ffi][Nested]")
{
  auto a = Descriptor(MakeCallback(Builtin(NativeType::Float64), {Builtin(NativeType::Float64)}));
  auto b = Descriptor(MakeCallback(Builtin(NativeType::Void), std::span<const TypePtr>{}));
  auto c = Descriptor(MakeCallback(Builtin(NativeType::Int8), {Builtin(NativeType::Int64), Builtin(NativeType::String)}));
  for (const auto &cb : {a, b, c})
  {
    REQUIRE(cb != nullptr);
    CHECK(cb->GetNativeType() == NativeType::Pointer);
    REQUIRE(cb->AsNativeParam() != nullptr);
    CHECK(cb->AsNativeParam()->GetNativeType() == NativeType::Pointer);
    CHECK(cb->AsType() == cb.get());
    CHECK(cb->AsSequence() == nullptr);
  }
}

TEST_CASE("CallbackOfCallbackValidates", "[ffi][Nested]")
{
  auto inner = Descriptor(MakeCallback(Builtin(NativeType::Int32), {Builtin(NativeType::Pointer)}));
  REQUIRE(inner != nullptr);

  auto list = std::make_shared<ValueList>();
  list->PushBack(inner);
  list->PushBack(Builtin(NativeType::Pointer));

  auto outer = Descriptor(MakeCallback(inner, list));
  REQUIRE(outer != nullptr);
  CHECK(outer->GetArity() == 2);
  CHECK(outer->GetParameterType(0) == inner);
  CHECK(outer->GetReturnType() == inner);
  CHECK(outer->Render() ==
        "[ callbackinfo[parameters=[pointer] return=int32], pointer ], callbackinfo[parameters=[pointer] return=int32]");
}

TEST_CASE("BuiltinTypesExposeNativeParamCapability", "[ffi][Nested]")
{
  CHECK(Builtin(NativeType::Int32)->AsNativeParam() != nullptr);
  CHECK(Builtin(NativeType::Pointer)->AsNativeParam() != nullptr);
  CHECK(Builtin(NativeType::Void)->AsNativeParam() == nullptr);
  CHECK(Builtin(NativeType::Varargs)->AsNativeParam() == nullptr);
  CHECK(GetBuiltinType(NativeType::Struct) == nullptr);
  CHECK(Builtin(NativeType::Int32) == Builtin(NativeType::Int32));
}

TEST_CASE("NativeTypeNamesAndCodes", "[ffi][Nested]")
{
  CHECK(NativeTypeName(NativeType::Int32) == "INT32");
  CHECK(NativeTypeName(NativeType::Pointer) == "POINTER");
  CHECK(NativeTypeName(NativeType::Void) == "VOID");
  CHECK(NativeTypeName(static_cast<NativeType>(200)).empty());

  REQUIRE(NativeTypeFromCode(static_cast<NGIN::UInt8>(NativeType::Float32)).has_value());
  CHECK(*NativeTypeFromCode(static_cast<NGIN::UInt8>(NativeType::Float32)) == NativeType::Float32);
  CHECK_FALSE(NativeTypeFromCode(kNativeTypeCount).has_value());
  CHECK(Builtin(NativeType::UInt64)->ToString() == "UINT64");
}
