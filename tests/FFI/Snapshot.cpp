// Snapshot.cpp — the descriptor owns its parameter list

#include <catch2/catch_test_macros.hpp>

#include <NGIN/FFI/FFI.hpp>

#include "TestValues.hpp"

#include <vector>

using namespace NGIN::FFI;
using FFITest::Builtin;
using FFITest::Descriptor;

TEST_CASE("MutatingCallerListDoesNotChangeDescriptor", "[ffi][Snapshot]")
{
  auto list = std::make_shared<ValueList>(std::initializer_list<ValuePtr>{Builtin(NativeType::Int32), Builtin(NativeType::Pointer)});

  auto cb = Descriptor(MakeCallback(Builtin(NativeType::Void), list));
  REQUIRE(cb != nullptr);
  const auto before = cb->Render();

  list->Set(0, Builtin(NativeType::Float64));
  list->Set(1, FFITest::MakeSymbol("garbage"));
  list->PushBack(Builtin(NativeType::Int8));

  CHECK(cb->GetArity() == 2);
  REQUIRE(cb->GetParameterTypes().Size() == 2);
  CHECK(cb->GetParameterType(0) == Builtin(NativeType::Int32));
  CHECK(cb->GetParameterType(1) == Builtin(NativeType::Pointer));
  CHECK(cb->Render() == before);
}

TEST_CASE("MutatingCallerVectorDoesNotChangeDescriptor", "[ffi][Snapshot]")
{
  std::vector<TypePtr> params = {Builtin(NativeType::UInt8), Builtin(NativeType::UInt16)};
  auto cb = Descriptor(MakeCallback(Builtin(NativeType::Int32), params));
  REQUIRE(cb != nullptr);

  params[0] = Builtin(NativeType::Float32);
  params.push_back(Builtin(NativeType::Pointer));
  params.clear();

  CHECK(cb->GetArity() == 2);
  CHECK(cb->GetParameterType(0) == Builtin(NativeType::UInt8));
  CHECK(cb->GetParameterType(1) == Builtin(NativeType::UInt16));
}

TEST_CASE("DescriptorKeepsTypesAliveAfterCallerReleasesThem", "[ffi][Snapshot]")
{
  CallbackDescriptorPtr cb;
  {
    auto layout = std::make_shared<const FFITest::StructLayout>();
    auto list = std::make_shared<ValueList>();
    list->PushBack(layout);
    cb = Descriptor(MakeCallback(Builtin(NativeType::Void), list));
  }
  REQUIRE(cb != nullptr);
  REQUIRE(cb->GetParameterType(0) != nullptr);
  CHECK(cb->GetParameterType(0)->GetNativeType() == NativeType::Struct);
}
