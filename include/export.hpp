#pragma once

#if defined(_WIN32)
    #if defined(YANGKEYS_EXPORT)
        #define YANGKEYS_API __declspec(dllexport)
    #else
        #define YANGKEYS_API __declspec(dllimport)
    #endif
#else
    #define YANGKEYS_API __attribute__((visibility("default")))
#endif
