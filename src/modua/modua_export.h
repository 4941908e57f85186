#pragma once

#if defined(_WIN32) && defined(MODUA_SHARED)
    #ifdef MODUA_BUILDING_DLL
        #define MODUA_API __declspec(dllexport)
    #else
        #define MODUA_API __declspec(dllimport)
    #endif
#else
    #define MODUA_API
#endif
