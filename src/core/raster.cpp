#include "raster.h"

#include "checked_math.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <utility>

namespace tessera::core {
namespace {

void copy_rows(const unsigned char* src, int w, int h, unsigned char* dst, size_t dst_row_stride) {
    const size_t row_bytes = static_cast<size_t>(w) * k_channels;
    for (int row = 0; row < h; ++row) {
        std::memcpy(dst + static_cast<size_t>(row) * dst_row_stride, src + static_cast<size_t>(row) * row_bytes, row_bytes);
    }
}

void area_average(const unsigned char* src, int src_w, int src_h,
                  unsigned char* dst, size_t dst_row_stride, int dst_w, int dst_h) {
    const size_t src_row_bytes = static_cast<size_t>(src_w) * k_channels;
    for (int row = 0; row < dst_h; ++row) {
        const int y0 = static_cast<int>((static_cast<int64_t>(row) * src_h) / dst_h);
        int y1 = static_cast<int>((static_cast<int64_t>(row + 1) * src_h) / dst_h);
        y1 = std::max(y1, y0 + 1);
        for (int col = 0; col < dst_w; ++col) {
            const int x0 = static_cast<int>((static_cast<int64_t>(col) * src_w) / dst_w);
            int x1 = static_cast<int>((static_cast<int64_t>(col + 1) * src_w) / dst_w);
            x1 = std::max(x1, x0 + 1);

            uint64_t sums[k_channels] = {0, 0, 0, 0};
            for (int sy = y0; sy < y1; ++sy) {
                const unsigned char* line = src + static_cast<size_t>(sy) * src_row_bytes;
                for (int sx = x0; sx < x1; ++sx) {
                    const unsigned char* px = line + static_cast<size_t>(sx) * k_channels;
                    for (size_t c = 0; c < k_channels; ++c) {
                        sums[c] += px[c];
                    }
                }
            }
            const uint64_t count = static_cast<uint64_t>(x1 - x0) * static_cast<uint64_t>(y1 - y0);
            unsigned char* out = dst + static_cast<size_t>(row) * dst_row_stride + static_cast<size_t>(col) * k_channels;
            for (size_t c = 0; c < k_channels; ++c) {
                out[c] = static_cast<unsigned char>((sums[c] + count / 2) / count);
            }
        }
    }
}

void bilinear(const unsigned char* src, int src_w, int src_h,
              unsigned char* dst, size_t dst_row_stride, int dst_w, int dst_h) {
    const size_t src_row_bytes = static_cast<size_t>(src_w) * k_channels;
    const double scale_x = static_cast<double>(src_w) / dst_w;
    const double scale_y = static_cast<double>(src_h) / dst_h;
    for (int row = 0; row < dst_h; ++row) {
        const double fy = std::clamp((row + 0.5) * scale_y - 0.5, 0.0, static_cast<double>(src_h - 1));
        const int y0 = static_cast<int>(fy);
        const int y1 = std::min(y0 + 1, src_h - 1);
        const double ty = fy - y0;
        for (int col = 0; col < dst_w; ++col) {
            const double fx = std::clamp((col + 0.5) * scale_x - 0.5, 0.0, static_cast<double>(src_w - 1));
            const int x0 = static_cast<int>(fx);
            const int x1 = std::min(x0 + 1, src_w - 1);
            const double tx = fx - x0;

            const unsigned char* p00 = src + static_cast<size_t>(y0) * src_row_bytes + static_cast<size_t>(x0) * k_channels;
            const unsigned char* p10 = src + static_cast<size_t>(y0) * src_row_bytes + static_cast<size_t>(x1) * k_channels;
            const unsigned char* p01 = src + static_cast<size_t>(y1) * src_row_bytes + static_cast<size_t>(x0) * k_channels;
            const unsigned char* p11 = src + static_cast<size_t>(y1) * src_row_bytes + static_cast<size_t>(x1) * k_channels;
            unsigned char* out = dst + static_cast<size_t>(row) * dst_row_stride + static_cast<size_t>(col) * k_channels;
            for (size_t c = 0; c < k_channels; ++c) {
                const double top = p00[c] + (p10[c] - p00[c]) * tx;
                const double bottom = p01[c] + (p11[c] - p01[c]) * tx;
                const double value = top + (bottom - top) * ty;
                out[c] = static_cast<unsigned char>(std::clamp(std::lround(value), 0L, 255L));
            }
        }
    }
}

} // namespace

bool raster_is_valid(const DecodedRaster& raster) {
    size_t expected = 0;
    return rgba_byte_count(raster.width, raster.height, expected) && raster.pixels.size() == expected;
}

void release_raster(DecodedRaster& raster) {
    std::vector<unsigned char>().swap(raster.pixels);
    raster.width = 0;
    raster.height = 0;
}

bool draw_scaled(const unsigned char* src,
                 int src_w,
                 int src_h,
                 std::vector<unsigned char>& dest,
                 int dest_width,
                 int dst_x,
                 int dst_y,
                 int dst_w,
                 int dst_h,
                 std::string& error) {
    if (src == nullptr || src_w <= 0 || src_h <= 0) {
        error = "empty source raster";
        return false;
    }
    if (dest_width <= 0 || dst_x < 0 || dst_y < 0 || dst_w <= 0 || dst_h <= 0 || dst_x > dest_width - dst_w) {
        error = "destination rectangle out of bounds";
        return false;
    }
    size_t row_stride = 0;
    size_t last_row_start = 0;
    size_t first_pixel = 0;
    size_t end_offset = 0;
    if (!checked_mul_size_t(static_cast<size_t>(dest_width), k_channels, row_stride)
        || !checked_mul_size_t(static_cast<size_t>(dst_y + dst_h - 1), row_stride, last_row_start)
        || !checked_add_size_t(last_row_start, static_cast<size_t>(dst_x + dst_w) * k_channels, end_offset)
        || end_offset > dest.size()) {
        error = "destination rectangle out of bounds";
        return false;
    }
    first_pixel = static_cast<size_t>(dst_y) * row_stride + static_cast<size_t>(dst_x) * k_channels;
    unsigned char* dst = dest.data() + first_pixel;

    if (src_w == dst_w && src_h == dst_h) {
        copy_rows(src, src_w, src_h, dst, row_stride);
    } else if (dst_w <= src_w && dst_h <= src_h) {
        area_average(src, src_w, src_h, dst, row_stride, dst_w, dst_h);
    } else {
        bilinear(src, src_w, src_h, dst, row_stride, dst_w, dst_h);
    }
    return true;
}

bool resample_raster(const DecodedRaster& source,
                     int width,
                     int height,
                     DecodedRaster& out,
                     std::string& error) {
    if (!raster_is_valid(source)) {
        error = "invalid source raster '" + source.id + "'";
        return false;
    }
    size_t bytes = 0;
    if (!rgba_byte_count(width, height, bytes)) {
        error = "invalid target size " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }
    DecodedRaster scaled;
    scaled.id = source.id;
    scaled.width = width;
    scaled.height = height;
    scaled.pixels.assign(bytes, 0);
    if (!draw_scaled(source.pixels.data(), source.width, source.height, scaled.pixels, width, 0, 0, width, height, error)) {
        return false;
    }
    out = std::move(scaled);
    return true;
}

} // namespace tessera::core
