#pragma once

#include <iostream>

#ifndef NDEBUG
    #define DEBUG_LOG(x) std::cout << x
    #define DEBUG_LOG_ENDL std::endl
#else
    #define DEBUG_LOG(x) ((void)0)
    #define DEBUG_LOG_ENDL ((void)0)
#endif

// Warnings and errors are reported in release builds too
#define WARN_LOG(x) (std::cerr << "[warn] " << x << std::endl)
#define ERROR_LOG(x) (std::cerr << "[error] " << x << std::endl)
