#pragma once

#include <string>

namespace tessera::core {

// A source photo as known to the caller: identifier plus natural pixel size.
struct Image {
    std::string id;
    int width = 0;
    int height = 0;
};

struct PixelSize {
    int width = 0;
    int height = 0;
};

} // namespace tessera::core
