#pragma once

#if defined(_WIN32) || defined(__CYGWIN__)
  #if defined(SIGNET_EXPORTS)
    #define SIGNET_API __declspec(dllexport)
  #elif defined(SIGNET_SHARED)
    #define SIGNET_API __declspec(dllimport)
  #else
    #define SIGNET_API
  #endif
#elif defined(__GNUC__) && __GNUC__ >= 4
  #define SIGNET_API __attribute__((visibility("default")))
#else
  #define SIGNET_API
#endif
