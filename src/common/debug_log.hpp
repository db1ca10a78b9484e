#pragma once

#ifndef NDEBUG
    #include <iostream>
    #define PTT_DEBUG_LOG(x) std::cout << x
    #define PTT_DEBUG_LOG_ENDL std::endl
#else
    #define PTT_DEBUG_LOG(x) ((void)0)
    #define PTT_DEBUG_LOG_ENDL ((void)0)
#endif
