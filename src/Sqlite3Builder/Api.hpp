// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(__GNUC__)
    #define SQLITE3BUILDER_NO_EXPORT    __attribute__((visibility("hidden")))
    #define SQLITE3BUILDER_EXPORT       __attribute__((visibility("default")))
    #define SQLITE3BUILDER_IMPORT       /*!*/
    #define SQLITE3BUILDER_FORCE_INLINE __attribute__((always_inline))
#elif defined(_MSC_VER)
    #define SQLITE3BUILDER_NO_EXPORT    /*!*/
    #define SQLITE3BUILDER_EXPORT       __declspec(dllexport)
    #define SQLITE3BUILDER_IMPORT       __declspec(dllimport)
    #define SQLITE3BUILDER_FORCE_INLINE __forceinline
#endif

#if defined(SQLITE3BUILDER_SHARED)
    #if defined(BUILD_SQLITE3BUILDER)
        #define SQLITE3BUILDER_API SQLITE3BUILDER_EXPORT
    #else
        #define SQLITE3BUILDER_API SQLITE3BUILDER_IMPORT
    #endif
#else
    #define SQLITE3BUILDER_API /*!*/
#endif
