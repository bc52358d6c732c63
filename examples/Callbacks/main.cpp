#include <NGIN/FFI/ABI.hpp>
#include <NGIN/FFI/FFI.hpp>
#include <NGIN/FFI/Log.hpp>

#include <iostream>

int main()
{
  using namespace NGIN::FFI;
  Log::SetLevel(spdlog::level::info);

  // void (*)(int (*)(void *), void *), a qsort-style comparator registration
  auto comparator = MakeCallback(GetBuiltinType(NativeType::Int32), {GetBuiltinType(NativeType::Pointer)});
  if (!comparator || !comparator->IsAvailable())
    return 1;

  auto outer = MakeCallback(GetBuiltinType(NativeType::Void),
                            {TypePtr{comparator->Descriptor()}, GetBuiltinType(NativeType::Pointer)});
  if (!outer || !outer->IsAvailable())
    return 1;
  std::cout << outer->Descriptor()->ToString() << "\n";

  // Hand the signature to a trampoline generator.
  const auto blob = ExportSignatureV1(*outer->Descriptor());
  auto sig = ReadSignatureV1(blob.View());
  if (!sig)
  {
    std::cout << "bad blob: " << sig.error().message << "\n";
    return 1;
  }
  std::cout << "return " << NativeTypeName(sig->returnType) << ", params:";
  for (NGIN::UIntSize i = 0; i < sig->Arity(); ++i)
    std::cout << " " << NativeTypeName(sig->ParameterAt(i));
  std::cout << "\n";

  // A host without long double closures degrades gracefully.
  BoundaryConfig cfg{};
  cfg.longDouble = false;
  HostBoundary boundary{cfg};
  auto ld = SignatureValidator{boundary}.Validate(GetBuiltinType(NativeType::LongDouble), {GetBuiltinType(NativeType::Int32)});
  if (ld && !ld->IsAvailable())
    std::cout << "long double callback: " << UnavailableReasonName(ld->GetUnavailable()->reason) << "\n";
  return 0;
}
