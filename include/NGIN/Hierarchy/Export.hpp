#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(NGIN_HIERARCHY_STATIC)
    #define NGIN_HIERARCHY_API
  #else
    #if defined(NGIN_HIERARCHY_EXPORTS)
      #define NGIN_HIERARCHY_API __declspec(dllexport)
    #else
      #define NGIN_HIERARCHY_API __declspec(dllimport)
    #endif
  #endif
#else
  #if defined(NGIN_HIERARCHY_EXPORTS)
    #define NGIN_HIERARCHY_API __attribute__((visibility("default")))
  #else
    #define NGIN_HIERARCHY_API
  #endif
#endif

