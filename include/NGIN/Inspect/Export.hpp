
#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_INSPECT_STATIC)
    #define NGIN_INSPECT_API
  #else
    #if defined(NGIN_INSPECT_EXPORTS)
      #define NGIN_INSPECT_API __declspec(dllexport)
    #else
      #define NGIN_INSPECT_API __declspec(dllimport)
    #endif
  #endif
#else
  #define NGIN_INSPECT_API
#endif
