#pragma once

#if defined(_WIN32)
    #if defined(MINESPEC_EXPORT)
        #define MINESPEC_API __declspec(dllexport)
    #else
        #define MINESPEC_API __declspec(dllimport)
    #endif
#else
    #define MINESPEC_API __attribute__((visibility("default")))
#endif
