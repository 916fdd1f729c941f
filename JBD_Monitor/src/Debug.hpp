
#ifndef __DEBUG_HPP__
#define __DEBUG_HPP__

// -----------------------------------------------------------------------------------------------

#include <cstdarg>
#include <cstdio>

#ifdef DEBUG
    typedef void (*__DebugLoggerFunc)(const char*, ...);
    inline __DebugLoggerFunc __debugLoggerFunc = nullptr;
    inline void __debugLoggerStderr(const char* format, ...) { va_list args; va_start(args, format); vfprintf(stderr, format, args); va_end(args); }
    inline __DebugLoggerFunc __debugLoggerSet(__DebugLoggerFunc func = nullptr) {
        if (func == nullptr && __debugLoggerFunc == __debugLoggerStderr) fflush(stderr);
        __DebugLoggerFunc prev = __debugLoggerFunc;
        __debugLoggerFunc = func;
        return prev;
    }
#ifdef DEBUG_LOGGER_INITIAL_STDERR
    #define DEBUG_START(...) __debugLoggerSet(__debugLoggerStderr)
#else
    #define DEBUG_START(...) do {} while (0)
#endif
    #define DEBUG_END(...) __debugLoggerSet()
    #define DEBUG_PRINTF(...) do { if (__debugLoggerFunc) __debugLoggerFunc(__VA_ARGS__); } while (0)
#else
    #define DEBUG_START(...)
    #define DEBUG_END(...)
    #define DEBUG_PRINTF(...) do {} while (0)
#endif

// -----------------------------------------------------------------------------------------------

#endif
