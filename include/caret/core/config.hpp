#ifndef AMT_CARET_CORE_CONFIG_HPP
#define AMT_CARET_CORE_CONFIG_HPP

#if !defined(CARET_OS_WIN) && !defined(CARET_OS_UNIX)
    #if defined(_WIN32) || defined(__SYMBIAN32__)
        #define CARET_OS_WIN
    #elif defined(linux) || defined(__linux)
        #define CARET_OS_LINUX
        #define CARET_OS_UNIX
    #elif defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__) || \
          defined(__DragonFly__)
        #define CARET_OS_BSD
        #define CARET_OS_UNIX
    #else
        #define CARET_OS_UNIX
    #endif
#endif

#if defined(_MSC_VER)
    #define CARET_COMPILER_MSVC
#elif defined(__clang__)
    #define CARET_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
    #define CARET_COMPILER_GCC
#endif

#ifdef CARET_COMPILER_MSVC
    #define CARET_ALWAYS_INLINE __forceinline
#else
    #define CARET_ALWAYS_INLINE __attribute__((always_inline)) inline
#endif

namespace caret {
#ifndef CARET_SIZE_TYPE
    using dsize_t = unsigned;
#else
    using dsize_t = CARET_SIZE_TYPE;
#endif
} // namespace caret

#endif // AMT_CARET_CORE_CONFIG_HPP
