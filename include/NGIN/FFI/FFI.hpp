#pragma once

#include <string_view>

#include <NGIN/FFI/Export.hpp>
#include <NGIN/FFI/Config.hpp>
#include <NGIN/FFI/NativeType.hpp>
#include <NGIN/FFI/Types.hpp>
#include <NGIN/FFI/Value.hpp>
#include <NGIN/FFI/Registry.hpp>
#include <NGIN/FFI/ModuleInit.hpp>
#include <NGIN/FFI/Boundary.hpp>
#include <NGIN/FFI/CallbackDescriptor.hpp>
#include <NGIN/FFI/SignatureValidator.hpp>

namespace NGIN::FFI
{

    // For quick sanity checks / examples.
    [[nodiscard]] NGIN_FFI_API constexpr std::string_view LibraryName() noexcept { return "NGIN.FFI"; }

} // namespace NGIN::FFI
