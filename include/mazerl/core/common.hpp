#pragma once

// -------------------------------------------------------------------------
// 1. PLATFORM DETECTION & SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // avoid clashes with std::min/std::max on Windows
    #include <windows.h>
#else
    #include <sys/time.h>
    #include <ctime>
#endif

// -------------------------------------------------------------------------
// 2. STANDARD C++ LIBRARY (Commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <array>
#include <string>
#include <map>
#include <queue>
#include <stack>
#include <variant>
#include <utility> // std::pair
#include <functional> // std::function

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric> // std::iota
#include <limits>  // std::numeric_limits

// IO & Strings
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdio>
#include <cstdint>

// Errors
#include <stdexcept>

// Concurrency & Randoms
#include <atomic>
#include <random>
#include <chrono>
#include <thread>

#include <memory>

// -------------------------------------------------------------------------
// 3. GLOBAL CONSTANTS
// -------------------------------------------------------------------------
namespace mazerl::core {

    constexpr int MIN_GRID_SIZE = 5;     // smallest accepted side of a maze
    constexpr int MAX_GRID_SIZE = 30;    // largest side accepted by the driver
    constexpr int NUM_ACTIONS   = 4;     // up, right, down, left

}
