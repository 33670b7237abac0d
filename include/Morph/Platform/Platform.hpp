#pragma once

// Platform Detection
#if defined(_WIN32) || defined(_WIN64)
    #define MORPH_PLATFORM_WINDOWS 1
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__APPLE__) && defined(__MACH__)
    #define MORPH_PLATFORM_APPLE 1
#elif defined(__linux__)
    #define MORPH_PLATFORM_LINUX 1
#elif defined(__unix__)
    #define MORPH_PLATFORM_UNIX 1
#else
    #error "Unknown platform"
#endif

// Compiler Detection
#if defined(_MSC_VER)
    #define MORPH_COMPILER_MSVC 1
    #define MORPH_COMPILER_VERSION _MSC_VER
#elif defined(__clang__)
    #define MORPH_COMPILER_CLANG 1
    #define MORPH_COMPILER_VERSION (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) || defined(__GNUG__)
    #define MORPH_COMPILER_GCC 1
    #define MORPH_COMPILER_VERSION (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#else
    #error "Unknown compiler"
#endif

// Build Configuration Detection (set by build system)
#if defined(MORPH_BUILD_DEBUG)
    #define MORPH_BUILD_TYPE "Debug"
#elif defined(MORPH_BUILD_RELEASE)
    #define MORPH_BUILD_TYPE "Release"
#else
    #define MORPH_BUILD_TYPE "Unknown"
#endif

// C++ Standard Detection
#if __cplusplus >= 202002L || (defined(_MSVC_LANG) && _MSVC_LANG >= 202002L)
    #define MORPH_CPP20 1
#else
    #error "Morph requires C++20 or later"
#endif
