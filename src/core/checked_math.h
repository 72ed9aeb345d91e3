#pragma once

#include <cstddef>
#include <limits>

namespace tessera::core {

inline bool checked_add_int(int a, int b, int& out) {
    if (b > 0 && a > std::numeric_limits<int>::max() - b) {
        return false;
    }
    if (b < 0 && a < std::numeric_limits<int>::min() - b) {
        return false;
    }
    out = a + b;
    return true;
}

inline bool checked_add_size_t(size_t a, size_t b, size_t& out) {
    if (a > std::numeric_limits<size_t>::max() - b) {
        return false;
    }
    out = a + b;
    return true;
}

inline bool checked_mul_size_t(size_t a, size_t b, size_t& out) {
    if (a == 0 || b <= std::numeric_limits<size_t>::max() / a) {
        out = a * b;
        return true;
    }
    return false;
}

// Byte length of a tightly packed RGBA buffer of the given size.
inline bool rgba_byte_count(int width, int height, size_t& out) {
    if (width <= 0 || height <= 0) {
        return false;
    }
    size_t pixels = 0;
    return checked_mul_size_t(static_cast<size_t>(width), static_cast<size_t>(height), pixels)
        && checked_mul_size_t(pixels, static_cast<size_t>(4), out);
}

} // namespace tessera::core
