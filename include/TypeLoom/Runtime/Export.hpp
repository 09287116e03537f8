#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(TYPELOOM_RUNTIME_STATIC)
    #define TYPELOOM_RUNTIME_API
  #else
    #if defined(TYPELOOM_RUNTIME_EXPORTS)
      #define TYPELOOM_RUNTIME_API __declspec(dllexport)
    #else
      #define TYPELOOM_RUNTIME_API __declspec(dllimport)
    #endif
  #endif
#else
  #define TYPELOOM_RUNTIME_API
#endif
