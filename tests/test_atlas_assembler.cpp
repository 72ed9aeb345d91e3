#include <gtest/gtest.h>
#include "core/atlas_assembler.h"

#include <filesystem>
#include <string>
#include <vector>

using namespace tessera::core;

namespace {

DecodedRaster solid(const std::string& id, int w, int h, unsigned char r, unsigned char g, unsigned char b) {
    DecodedRaster raster;
    raster.id = id;
    raster.width = w;
    raster.height = h;
    raster.pixels.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * k_channels);
    for (size_t i = 0; i < raster.pixels.size(); i += k_channels) {
        raster.pixels[i] = r;
        raster.pixels[i + 1] = g;
        raster.pixels[i + 2] = b;
        raster.pixels[i + 3] = 255;
    }
    return raster;
}

const unsigned char* pixel_at(const Atlas& atlas, int x, int y) {
    return atlas.pixels.data() + (static_cast<size_t>(y) * atlas.size + static_cast<size_t>(x)) * k_channels;
}

} // namespace

TEST(AtlasAssemblerTest, DrawsRasterAtItsRectangle) {
    std::vector<DecodedRaster> rasters;
    rasters.push_back(solid("red", 10, 10, 255, 0, 0));
    std::vector<PackedRect> placement = {{"red", 5, 5, 10, 10}};

    AssemblyResult result;
    std::string error;
    ASSERT_TRUE(assemble_atlas(std::move(rasters), placement, 64, DetailLevel::LEVEL_2,
                               PriorityClass::VISIBLE, 7, result, error)) << error;

    ASSERT_NE(result.atlas, nullptr);
    EXPECT_TRUE(result.failed.empty());
    EXPECT_EQ(result.atlas->size, 64);
    EXPECT_EQ(result.atlas->generation, 7u);
    EXPECT_EQ(result.atlas->level, DetailLevel::LEVEL_2);

    const unsigned char* inside = pixel_at(*result.atlas, 5, 5);
    EXPECT_EQ(inside[0], 255);
    EXPECT_EQ(inside[3], 255);
    const unsigned char* outside = pixel_at(*result.atlas, 0, 0);
    EXPECT_EQ(outside[3], 0);

    const AtlasRegion* region = result.atlas->find_region("red");
    ASSERT_NE(region, nullptr);
    EXPECT_EQ(region->x, 5);
    EXPECT_EQ(region->y, 5);
    EXPECT_EQ(region->width, 10);
    EXPECT_FLOAT_EQ(region->aspect_ratio, 1.0f);
    EXPECT_NEAR(result.atlas->utilization, 100.0 / (64.0 * 64.0), 1e-9);
}

TEST(AtlasAssemblerTest, MissingRasterLeavesGapAndIsReported) {
    std::vector<DecodedRaster> rasters;
    rasters.push_back(solid("present", 8, 8, 0, 255, 0));
    std::vector<PackedRect> placement = {{"present", 0, 0, 8, 8}, {"absent", 10, 0, 8, 8}};

    AssemblyResult result;
    std::string error;
    ASSERT_TRUE(assemble_atlas(std::move(rasters), placement, 32, DetailLevel::LEVEL_0,
                               PriorityClass::VISIBLE, 1, result, error));

    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0], "absent");
    EXPECT_NE(result.atlas->find_region("present"), nullptr);
    EXPECT_EQ(result.atlas->find_region("absent"), nullptr);
    EXPECT_EQ(pixel_at(*result.atlas, 12, 2)[3], 0);
}

TEST(AtlasAssemblerTest, CorruptRasterIsSkipped) {
    DecodedRaster broken = solid("broken", 4, 4, 1, 2, 3);
    broken.pixels.resize(10);
    std::vector<DecodedRaster> rasters;
    rasters.push_back(std::move(broken));
    rasters.push_back(solid("fine", 4, 4, 9, 9, 9));
    std::vector<PackedRect> placement = {{"broken", 0, 0, 4, 4}, {"fine", 6, 0, 4, 4}};

    AssemblyResult result;
    std::string error;
    ASSERT_TRUE(assemble_atlas(std::move(rasters), placement, 16, DetailLevel::LEVEL_0,
                               PriorityClass::VISIBLE, 1, result, error));

    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0], "broken");
    EXPECT_EQ(result.atlas->regions.size(), 1u);
}

TEST(AtlasAssemblerTest, RectangleOutsideAtlasIsReported) {
    std::vector<DecodedRaster> rasters;
    rasters.push_back(solid("edge", 8, 8, 1, 1, 1));
    std::vector<PackedRect> placement = {{"edge", 12, 12, 8, 8}};

    AssemblyResult result;
    std::string error;
    ASSERT_TRUE(assemble_atlas(std::move(rasters), placement, 16, DetailLevel::LEVEL_0,
                               PriorityClass::VISIBLE, 1, result, error));
    EXPECT_EQ(result.failed.size(), 1u);
    EXPECT_TRUE(result.atlas->regions.empty());
}

TEST(AtlasAssemblerTest, ShrinkingAveragesSourcePixels) {
    DecodedRaster checker;
    checker.id = "checker";
    checker.width = 2;
    checker.height = 2;
    checker.pixels = {
        0, 0, 0, 255,   255, 255, 255, 255,
        255, 255, 255, 255,   0, 0, 0, 255,
    };
    std::vector<DecodedRaster> rasters;
    rasters.push_back(std::move(checker));
    std::vector<PackedRect> placement = {{"checker", 0, 0, 1, 1}};

    AssemblyResult result;
    std::string error;
    ASSERT_TRUE(assemble_atlas(std::move(rasters), placement, 4, DetailLevel::LEVEL_0,
                               PriorityClass::VISIBLE, 1, result, error));

    const unsigned char* px = pixel_at(*result.atlas, 0, 0);
    EXPECT_EQ(px[0], 128);
    EXPECT_EQ(px[3], 255);
    EXPECT_FLOAT_EQ(result.atlas->find_region("checker")->aspect_ratio, 1.0f);
}

TEST(AtlasAssemblerTest, GrowingInterpolatesSmoothly) {
    std::vector<DecodedRaster> rasters;
    rasters.push_back(solid("dot", 1, 1, 40, 80, 120));
    std::vector<PackedRect> placement = {{"dot", 2, 2, 4, 4}};

    AssemblyResult result;
    std::string error;
    ASSERT_TRUE(assemble_atlas(std::move(rasters), placement, 8, DetailLevel::LEVEL_0,
                               PriorityClass::VISIBLE, 1, result, error));

    for (int y = 2; y < 6; ++y) {
        for (int x = 2; x < 6; ++x) {
            const unsigned char* px = pixel_at(*result.atlas, x, y);
            EXPECT_EQ(px[0], 40);
            EXPECT_EQ(px[1], 80);
            EXPECT_EQ(px[2], 120);
        }
    }
}

TEST(AtlasAssemblerTest, InvalidAtlasSizeFails) {
    AssemblyResult result;
    std::string error;
    EXPECT_FALSE(assemble_atlas({}, {}, 0, DetailLevel::LEVEL_0, PriorityClass::VISIBLE, 1, result, error));
    EXPECT_FALSE(error.empty());
}

TEST(AtlasAssemblerTest, EncodesPng) {
    std::vector<DecodedRaster> rasters;
    rasters.push_back(solid("a", 4, 4, 10, 20, 30));
    AssemblyResult result;
    std::string error;
    ASSERT_TRUE(assemble_atlas(std::move(rasters), {{"a", 0, 0, 4, 4}}, 8, DetailLevel::LEVEL_0,
                               PriorityClass::VISIBLE, 1, result, error));

    std::vector<unsigned char> png;
    ASSERT_TRUE(encode_atlas_png(*result.atlas, png, error)) << error;
    ASSERT_GT(png.size(), 8u);
    EXPECT_EQ(png[0], 0x89);
    EXPECT_EQ(png[1], 'P');
    EXPECT_EQ(png[2], 'N');
    EXPECT_EQ(png[3], 'G');
}

TEST(AtlasAssemblerTest, WritesPngFile) {
    std::vector<DecodedRaster> rasters;
    rasters.push_back(solid("a", 4, 4, 10, 20, 30));
    AssemblyResult result;
    std::string error;
    ASSERT_TRUE(assemble_atlas(std::move(rasters), {{"a", 0, 0, 4, 4}}, 8, DetailLevel::LEVEL_0,
                               PriorityClass::VISIBLE, 1, result, error));

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "tessera_atlas_test.png";
    ASSERT_TRUE(write_atlas_png(*result.atlas, path.string(), error)) << error;
    EXPECT_GT(std::filesystem::file_size(path), 8u);
    std::filesystem::remove(path);

    Atlas empty;
    EXPECT_FALSE(write_atlas_png(empty, path.string(), error));
}

TEST(RasterTest, ResampleProducesRequestedSize) {
    DecodedRaster source = solid("s", 10, 6, 5, 6, 7);
    DecodedRaster scaled;
    std::string error;
    ASSERT_TRUE(resample_raster(source, 5, 3, scaled, error)) << error;
    EXPECT_EQ(scaled.width, 5);
    EXPECT_EQ(scaled.height, 3);
    EXPECT_TRUE(raster_is_valid(scaled));
    EXPECT_EQ(scaled.pixels[0], 5);

    release_raster(scaled);
    EXPECT_TRUE(scaled.pixels.empty());
    EXPECT_EQ(scaled.pixels.capacity(), 0u);
}
