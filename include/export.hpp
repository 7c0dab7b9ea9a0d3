#pragma once

#if defined(_WIN32)
    #if defined(POLYDOC_EXPORT)
        #define POLYDOC_API __declspec(dllexport)
    #else
        #define POLYDOC_API __declspec(dllimport)
    #endif
#else
    #define POLYDOC_API __attribute__((visibility("default")))
#endif
