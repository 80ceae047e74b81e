#pragma once

#include <iostream>

// Compile with -DDEBUG=1 (or -DZONEPLAN_DEBUG=ON in CMake) to enable debug logging
#if DEBUG
    #define DBG(x) do { std::cerr << x << std::endl; } while (0)
    #define DBG_NOENDL(x) do { std::cerr << x; } while (0)
    // Prints "label: i0 i1 ..." for any iterable of indices
    #define DBG_INDICES(label, indices) do { \
        DBG_NOENDL(label << ":"); \
        for (auto idx_ : (indices)) { DBG_NOENDL(" " << idx_); } \
        DBG(""); \
    } while (0)
#else
    #define DBG(x) do {} while (0)
    #define DBG_NOENDL(x) do {} while (0)
    #define DBG_INDICES(label, indices) do {} while (0)
#endif
