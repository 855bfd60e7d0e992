#pragma once

#if defined(__linux__)
  #define SIGNRELAY_PLATFORM "linux"
#elif defined(__APPLE__)
  #define SIGNRELAY_PLATFORM "macos"
#elif defined(_WIN32)
  #define SIGNRELAY_PLATFORM "windows"
#else
  #define SIGNRELAY_PLATFORM "unknown"
#endif

#ifndef SIGNRELAY_VERSION
  #define SIGNRELAY_VERSION "0.1.0"
#endif

/// Macro alias for trailing return type functions.
#define fn auto
