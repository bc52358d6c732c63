#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_FFI_STATIC)
    #define NGIN_FFI_API
  #else
    #if defined(NGIN_FFI_EXPORTS)
      #define NGIN_FFI_API __declspec(dllexport)
    #else
      #define NGIN_FFI_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_FFI_API
#endif
