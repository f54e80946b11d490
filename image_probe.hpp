#ifndef IMAGE_PROBE_HPP
#define IMAGE_PROBE_HPP

#include <string>
#include <cstdint>
#include <filesystem>

enum class ImageFormat {
    Sparse,
    Raw,
    Unknown
};

struct ImageFile {
    std::filesystem::path path;
    uint64_t size;
    ImageFormat format;
    // What `file -b` said about it
    std::string description;

    bool is_sparse() const { return format == ImageFormat::Sparse; }
};

const char* format_name(ImageFormat format);

// Maps a `file` description to a format tag.
ImageFormat classify_description(const std::string& description);

// Heuristic: an ext2/3/4 or EROFS filesystem, or an Android sparse image.
bool looks_like_filesystem(const std::string& description);

// Heuristic: an Android sparse image or opaque "data" (raw super images have no `file` magic).
bool looks_like_super(const std::string& description);

// Stats the file and classifies it with the external `file` tool.
ImageFile probe_image(const std::filesystem::path& path, const std::string& file_tool);

#endif // IMAGE_PROBE_HPP
