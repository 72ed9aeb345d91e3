#include "atlas.h"

#include "raster.h"

#include <fstream>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace tessera::core {

const char* priority_name(PriorityClass priority) {
    switch (priority) {
        case PriorityClass::PERSISTENT: return "persistent";
        case PriorityClass::VISIBLE: return "visible";
        case PriorityClass::ACTIVE: return "active";
        case PriorityClass::FOCUSED: return "focused";
    }
    return "unknown";
}

const AtlasRegion* Atlas::find_region(const std::string& id) const {
    const auto it = regions.find(id);
    if (it == regions.end()) {
        return nullptr;
    }
    return &it->second;
}

bool encode_atlas_png(const Atlas& atlas, std::vector<unsigned char>& out, std::string& error) {
    const size_t expected = static_cast<size_t>(atlas.size) * static_cast<size_t>(atlas.size) * k_channels;
    if (atlas.size <= 0 || atlas.pixels.size() != expected) {
        error = "atlas has no pixel buffer";
        return false;
    }
    out.clear();
    auto write_callback = [](void* context, void* data, int size) {
        auto* buffer = static_cast<std::vector<unsigned char>*>(context);
        const auto* bytes = static_cast<const unsigned char*>(data);
        buffer->insert(buffer->end(), bytes, bytes + size);
    };
    if (stbi_write_png_to_func(write_callback, &out,
                               atlas.size, atlas.size, static_cast<int>(k_channels),
                               atlas.pixels.data(), atlas.size * static_cast<int>(k_channels)) == 0) {
        error = "failed to encode PNG";
        return false;
    }
    return true;
}

bool write_atlas_png(const Atlas& atlas, const std::string& path, std::string& error) {
    std::vector<unsigned char> encoded;
    if (!encode_atlas_png(atlas, encoded, error)) {
        return false;
    }
    std::ofstream output(path, std::ios::binary);
    if (!output) {
        error = "failed to open '" + path + "'";
        return false;
    }
    output.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
    if (!output) {
        error = "failed to write '" + path + "'";
        return false;
    }
    return true;
}

} // namespace tessera::core
