#pragma once

#include "atlas.h"
#include "raster.h"
#include "shelf_packer.h"

#include <memory>
#include <string>
#include <vector>

namespace tessera::core {

struct AssemblyResult {
    std::shared_ptr<Atlas> atlas;
    std::vector<std::string> failed;
};

// Composes one atlas from `placement`, drawing each rectangle from the raster with the
// same id. Rasters are consumed: each buffer is freed right after it is drawn. A missing
// or corrupt raster leaves its rectangle transparent and lands in `failed`.
// Returns false only when the atlas buffer itself cannot be created.
bool assemble_atlas(std::vector<DecodedRaster> rasters,
                    const std::vector<PackedRect>& placement,
                    int atlas_size,
                    DetailLevel level,
                    PriorityClass priority,
                    uint64_t generation,
                    AssemblyResult& out,
                    std::string& error);

} // namespace tessera::core
