#pragma once

#include <iostream>
#include <cstdlib>

// Always-on logging for important messages (works in release too)
#define COHORT_LOG(msg) do { \
  std::cout << "[LOG] " << msg << std::endl; \
} while(0)

// Debug logging levels. Never stream submitted values or shares through these.
#ifdef COHORT_DEBUG_BUILD
  #define COHORT_INFO(msg) do { \
    std::cout << "[INFO] " << msg << std::endl; \
  } while(0)

  #define COHORT_DEBUG(msg) do { \
    std::cout << "[DEBUG] " << msg << std::endl; \
  } while(0)

  #define COHORT_WARN(msg) do { \
    std::cerr << "[WARN] " << msg << std::endl; \
  } while(0)

  #define COHORT_ERROR(msg) do { \
    std::cerr << "[ERROR] " << msg << std::endl; \
  } while(0)
#else
  // All debug macros become no-ops in release
  #define COHORT_INFO(msg) ((void)0)
  #define COHORT_DEBUG(msg) ((void)0)
  #define COHORT_WARN(msg) ((void)0)
  #define COHORT_ERROR(msg) ((void)0)
#endif

// Always log errors and exit (even in release)
#define COHORT_LOG_AND_EXIT(msg, code) do { \
  std::cerr << "[FATAL] " << msg << std::endl; \
  std::exit(code); \
} while(0)
