#include "photo_loader.h"

#include "checked_math.h"
#include "log.h"
#include "text_parse.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>
#include <utility>

#include <archive.h>
#include <archive_entry.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace fs = std::filesystem;

namespace tessera::core {
namespace {

constexpr uintmax_t k_max_photo_file_bytes = 1000000000;

bool read_file_bytes(const fs::path& path, std::vector<unsigned char>& out, std::string& error, bool& retryable) {
    std::error_code ec;
    const uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        error = "cannot stat '" + path.string() + "': " + ec.message();
        retryable = ec != std::errc::no_such_file_or_directory;
        return false;
    }
    if (size > k_max_photo_file_bytes) {
        error = "'" + path.string() + "' is too large";
        retryable = false;
        return false;
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        retryable = true;
        return false;
    }
    out.resize(static_cast<size_t>(size));
    if (size > 0 && !input.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size))) {
        error = "failed to read '" + path.string() + "'";
        retryable = true;
        return false;
    }
    return true;
}

bool probe_image_bytes(const unsigned char* data, size_t size, int& width, int& height) {
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return false;
    }
    int channels = 0;
    return stbi_info_from_memory(data, static_cast<int>(size), &width, &height, &channels) != 0
        && width > 0 && height > 0;
}

} // namespace

DecodeResult decode_failure(std::string reason, bool retryable) {
    DecodeResult result;
    result.ok = false;
    result.reason = std::move(reason);
    result.retryable = retryable;
    return result;
}

bool is_supported_image_extension(const fs::path& path) {
    const std::string ext = to_lower_copy(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" ||
           ext == ".tga" || ext == ".gif" || ext == ".psd" || ext == ".pic" ||
           ext == ".pnm" || ext == ".pgm" || ext == ".ppm" || ext == ".hdr";
}

bool decode_image_bytes(const std::string& id,
                        const unsigned char* data,
                        size_t size,
                        int target_width,
                        int target_height,
                        DecodedRaster& out,
                        std::string& error) {
    if (data == nullptr || size == 0 || size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error = "no image data for '" + id + "'";
        return false;
    }
    int w = 0;
    int h = 0;
    int channels = 0;
    unsigned char* pixels = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &channels,
                                                  static_cast<int>(k_channels));
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        error = "failed to decode '" + id + "': " + (reason != nullptr ? reason : "unknown error");
        return false;
    }
    size_t byte_count = 0;
    if (!rgba_byte_count(w, h, byte_count)) {
        stbi_image_free(pixels);
        error = "decoded image '" + id + "' is too large";
        return false;
    }
    DecodedRaster decoded;
    decoded.id = id;
    decoded.width = w;
    decoded.height = h;
    decoded.pixels.assign(pixels, pixels + byte_count);
    stbi_image_free(pixels);

    if (target_width <= 0 || target_height <= 0 || (target_width == w && target_height == h)) {
        out = std::move(decoded);
        return true;
    }
    return resample_raster(decoded, target_width, target_height, out, error);
}

FilePhotoLoader::FilePhotoLoader(fs::path root) : root_(std::move(root)) {}

bool FilePhotoLoader::available() const {
    std::error_code ec;
    return fs::is_directory(root_, ec);
}

DecodeResult FilePhotoLoader::decode(const std::string& id,
                                     int target_width,
                                     int target_height,
                                     const std::atomic<bool>& cancelled) {
    if (cancelled.load()) {
        return decode_failure("cancelled", false);
    }
    const fs::path path = root_ / fs::path(id);
    std::vector<unsigned char> bytes;
    std::string error;
    bool retryable = false;
    if (!read_file_bytes(path, bytes, error, retryable)) {
        return decode_failure(error, retryable);
    }
    if (cancelled.load()) {
        return decode_failure("cancelled", false);
    }
    DecodeResult result;
    if (!decode_image_bytes(id, bytes.data(), bytes.size(), target_width, target_height, result.raster, error)) {
        return decode_failure(error, false);
    }
    result.ok = true;
    return result;
}

bool FilePhotoLoader::scan(std::vector<Image>& out, std::string& error) const {
    out.clear();
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        error = "'" + root_.string() + "' is not a directory";
        return false;
    }
    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || !is_supported_image_extension(it->path())) {
            continue;
        }
        int w = 0;
        int h = 0;
        int channels = 0;
        if (stbi_info(it->path().string().c_str(), &w, &h, &channels) == 0 || w <= 0 || h <= 0) {
            log_message(LogLevel::Warning, "loader", "skipping unreadable image '" + it->path().string() + "'");
            continue;
        }
        out.push_back({fs::relative(it->path(), root_).generic_string(), w, h});
    }
    if (ec) {
        error = "failed to scan '" + root_.string() + "': " + ec.message();
        return false;
    }
    std::sort(out.begin(), out.end(), [](const Image& a, const Image& b) { return a.id < b.id; });
    return true;
}

bool ArchivePhotoLoader::open(const fs::path& archive_path, std::string& error) {
    entries_.clear();
    catalog_.clear();
    opened_ = false;

    struct archive* a = archive_read_new();
    if (!a) {
        error = "failed to create archive reader";
        return false;
    }
    archive_read_support_format_all(a);
    archive_read_support_filter_all(a);

    if (archive_read_open_filename(a, archive_path.string().c_str(), 10240) != ARCHIVE_OK) {
        error = "failed to open archive '" + archive_path.string() + "': " + archive_error_string(a);
        archive_read_free(a);
        return false;
    }

    bool ok = true;
    struct archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_OK) {
            error = std::string("failed to read archive header: ") + archive_error_string(a);
            ok = false;
            break;
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        const char* name = archive_entry_pathname(entry);
        if (name == nullptr || !is_supported_image_extension(fs::path(name))) {
            continue;
        }

        std::vector<unsigned char> bytes;
        const void* block = nullptr;
        size_t block_size = 0;
        la_int64_t offset = 0;
        int data_status = ARCHIVE_OK;
        while ((data_status = archive_read_data_block(a, &block, &block_size, &offset)) == ARCHIVE_OK) {
            const auto* begin = static_cast<const unsigned char*>(block);
            if (static_cast<size_t>(offset) > bytes.size()) {
                bytes.resize(static_cast<size_t>(offset), 0);
            }
            bytes.insert(bytes.end(), begin, begin + block_size);
        }
        if (data_status != ARCHIVE_EOF) {
            error = std::string("failed to read archive data: ") + archive_error_string(a);
            ok = false;
            break;
        }

        int w = 0;
        int h = 0;
        if (!probe_image_bytes(bytes.data(), bytes.size(), w, h)) {
            log_message(LogLevel::Warning, "loader", std::string("skipping unreadable archive entry '") + name + "'");
            continue;
        }
        const std::string id = fs::path(name).generic_string();
        // A later entry with the same path replaces the earlier one, as tar extraction does.
        auto existing = std::find_if(catalog_.begin(), catalog_.end(), [&](const Image& image) { return image.id == id; });
        if (existing != catalog_.end()) {
            log_message(LogLevel::Warning, "loader", "archive entry '" + id + "' appears more than once; keeping the last");
            *existing = Image{id, w, h};
        } else {
            catalog_.push_back({id, w, h});
        }
        entries_[id] = std::move(bytes);
    }

    archive_read_close(a);
    archive_read_free(a);
    if (!ok) {
        entries_.clear();
        catalog_.clear();
        return false;
    }
    std::sort(catalog_.begin(), catalog_.end(), [](const Image& x, const Image& y) { return x.id < y.id; });
    opened_ = true;
    return true;
}

bool ArchivePhotoLoader::available() const {
    return opened_;
}

DecodeResult ArchivePhotoLoader::decode(const std::string& id,
                                        int target_width,
                                        int target_height,
                                        const std::atomic<bool>& cancelled) {
    if (cancelled.load()) {
        return decode_failure("cancelled", false);
    }
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return decode_failure("no archive entry '" + id + "'", false);
    }
    DecodeResult result;
    std::string error;
    if (!decode_image_bytes(id, it->second.data(), it->second.size(), target_width, target_height,
                            result.raster, error)) {
        return decode_failure(error, false);
    }
    result.ok = true;
    return result;
}

} // namespace tessera::core
