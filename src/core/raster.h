#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tessera::core {

constexpr size_t k_channels = 4;

// Decoded RGBA8 pixels of one photo. Owned by whoever decoded it until handed to the assembler.
struct DecodedRaster {
    std::string id;
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels;
};

bool raster_is_valid(const DecodedRaster& raster);

// Frees the pixel storage, not just the size.
void release_raster(DecodedRaster& raster);

// Draws src (src_w x src_h, tightly packed RGBA) into the dst_w x dst_h rectangle at
// (dst_x, dst_y) of a dest_width-wide RGBA buffer. Same size copies rows, shrinking
// averages the covered source box, growing interpolates bilinearly.
bool draw_scaled(const unsigned char* src,
                 int src_w,
                 int src_h,
                 std::vector<unsigned char>& dest,
                 int dest_width,
                 int dst_x,
                 int dst_y,
                 int dst_w,
                 int dst_h,
                 std::string& error);

// Returns a new raster of the requested size; the source is left untouched.
bool resample_raster(const DecodedRaster& source,
                     int width,
                     int height,
                     DecodedRaster& out,
                     std::string& error);

} // namespace tessera::core
