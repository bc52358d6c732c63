#include <NGIN/FFI/FFI.hpp>

#include <iostream>
#include <memory>

int main()
{
  using namespace NGIN::FFI;
  std::cout << "Library: " << LibraryName() << "\n";

  // int (*)(int32_t, void *)
  auto params = std::make_shared<ValueList>();
  params->PushBack(GetBuiltinType(NativeType::Int32));
  params->PushBack(GetBuiltinType(NativeType::Pointer));

  auto result = MakeCallback(GetBuiltinType(NativeType::Int32), params);
  if (!result)
  {
    std::cout << "error: " << result.error().message << "\n";
    return 1;
  }
  if (!result->IsAvailable())
  {
    std::cout << "unavailable: " << UnavailableReasonName(result->GetUnavailable()->reason) << "\n";
    return 0;
  }

  auto cb = result->Descriptor();
  std::cout << "render:  " << cb->Render() << "\n";
  std::cout << "inspect: " << cb->Inspect() << "\n";
  std::cout << "arity:   " << cb->GetArity() << "\n";

  // A non-Type element is rejected with its position.
  params->PushBack(std::make_shared<ValueList>());
  auto bad = MakeCallback(GetBuiltinType(NativeType::Void), params);
  if (!bad)
    std::cout << "rejected: " << bad.error().message << "\n";
  return 0;
}
