#pragma once

// -------------------------------------------------------------------------
// 1. PLATFORM DETECTION & SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // Avoids std::min/std::max clashes on Windows
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
#include <unordered_map>
#include <utility> // std::pair, std::swap
#include <optional>
#include <span>
#include <functional> // std::function

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric> // std::accumulate
#include <limits>  // std::numeric_limits

// IO & Strings
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdio>
#include <cstdint>
#include <stdexcept>

// Randoms & Time
#include <random>
#include <chrono>

#include <memory> // std::unique_ptr
