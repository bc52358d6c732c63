// Config.hpp
// Build-time defaults for the native boundary. Override from the build system.
#pragma once

// Largest callback arity the host trampolines accept.
#ifndef NGIN_FFI_MAX_CALLBACK_ARITY
  #define NGIN_FFI_MAX_CALLBACK_ARITY 32
#endif

// Aggregates passed/returned by value.
#ifndef NGIN_FFI_ENABLE_STRUCT_BY_VALUE
  #define NGIN_FFI_ENABLE_STRUCT_BY_VALUE 1
#endif

// 80/128-bit long double slots. Off by default: most closure backends lack them.
#ifndef NGIN_FFI_ENABLE_LONG_DOUBLE
  #define NGIN_FFI_ENABLE_LONG_DOUBLE 0
#endif

// Targets with callback trampoline support.
#ifndef NGIN_FFI_HOST_SUPPORTED
  #if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86) || \
      defined(__aarch64__) || defined(_M_ARM64) || defined(__arm__) || defined(_M_ARM) ||  \
      (defined(__riscv) && __riscv_xlen == 64)
    #define NGIN_FFI_HOST_SUPPORTED 1
  #else
    #define NGIN_FFI_HOST_SUPPORTED 0
  #endif
#endif
