// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(__GNUC__)
    #define REFRACT_NO_EXPORT    __attribute__((visibility("hidden")))
    #define REFRACT_EXPORT       __attribute__((visibility("default")))
    #define REFRACT_IMPORT       /*!*/
    #define REFRACT_FORCE_INLINE __attribute__((always_inline))
#elif defined(_MSC_VER)
    #define REFRACT_NO_EXPORT    /*!*/
    #define REFRACT_EXPORT       __declspec(dllexport)
    #define REFRACT_IMPORT       __declspec(dllimport)
    #define REFRACT_FORCE_INLINE __forceinline
#endif

#if defined(REFRACT_SHARED)
    #if defined(BUILD_REFRACT)
        #define REFRACT_API REFRACT_EXPORT
    #else
        #define REFRACT_API REFRACT_IMPORT
    #endif
#else
    #define REFRACT_API /*!*/
#endif
