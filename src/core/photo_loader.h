#pragma once

#include "image.h"
#include "raster.h"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace tessera::core {

struct DecodeResult {
    bool ok = false;
    DecodedRaster raster;
    std::string reason;
    bool retryable = false;
};

DecodeResult decode_failure(std::string reason, bool retryable);

// Produces a decoded raster of one photo at a requested size. Implementations must be
// callable from several threads at once and should give up early once `cancelled` is set.
class PhotoLoader {
public:
    virtual ~PhotoLoader() = default;

    virtual bool available() const { return true; }
    virtual DecodeResult decode(const std::string& id,
                                int target_width,
                                int target_height,
                                const std::atomic<bool>& cancelled) = 0;
};

bool is_supported_image_extension(const std::filesystem::path& path);

// Decodes an encoded image held in memory and scales it to the target size.
bool decode_image_bytes(const std::string& id,
                        const unsigned char* data,
                        size_t size,
                        int target_width,
                        int target_height,
                        DecodedRaster& out,
                        std::string& error);

// Photos are files under a root directory; the id is the path relative to the root.
class FilePhotoLoader : public PhotoLoader {
public:
    explicit FilePhotoLoader(std::filesystem::path root);

    bool available() const override;
    DecodeResult decode(const std::string& id,
                        int target_width,
                        int target_height,
                        const std::atomic<bool>& cancelled) override;

    // Lists supported images below the root with their natural sizes, sorted by id.
    bool scan(std::vector<Image>& out, std::string& error) const;

private:
    std::filesystem::path root_;
};

// Photos are entries of a tar/zip bundle, read fully into memory by open().
class ArchivePhotoLoader : public PhotoLoader {
public:
    bool open(const std::filesystem::path& archive_path, std::string& error);

    bool available() const override;
    DecodeResult decode(const std::string& id,
                        int target_width,
                        int target_height,
                        const std::atomic<bool>& cancelled) override;

    const std::vector<Image>& catalog() const { return catalog_; }

private:
    std::unordered_map<std::string, std::vector<unsigned char>> entries_;
    std::vector<Image> catalog_;
    bool opened_ = false;
};

} // namespace tessera::core
