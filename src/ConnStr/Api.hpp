// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(__GNUC__)
    #define CONNSTR_NO_EXPORT __attribute__((visibility("hidden")))
    #define CONNSTR_EXPORT    __attribute__((visibility("default")))
    #define CONNSTR_IMPORT    /*!*/
#elif defined(_MSC_VER)
    #define CONNSTR_NO_EXPORT /*!*/
    #define CONNSTR_EXPORT    __declspec(dllexport)
    #define CONNSTR_IMPORT    __declspec(dllimport)
#endif

#if defined(CONNSTR_SHARED)
    #if defined(BUILD_CONNSTR)
        #define CONNSTR_API CONNSTR_EXPORT
    #else
        #define CONNSTR_API CONNSTR_IMPORT
    #endif
#else
    #define CONNSTR_API /*!*/
#endif
