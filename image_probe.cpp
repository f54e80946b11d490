#include "image_probe.hpp"
#include "process_runner.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <regex>

namespace {
    const std::regex sparse_re("Android sparse");
    const std::regex filesystem_re("(ext[2-4]|EROFS)");
    const std::regex data_re("\\bdata\\b");
}

const char* format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::Sparse: return "sparse";
        case ImageFormat::Raw: return "raw";
        case ImageFormat::Unknown: break;
    }
    return "unknown";
}

ImageFormat classify_description(const std::string& description) {
    if (std::regex_search(description, sparse_re)) return ImageFormat::Sparse;
    if (std::regex_search(description, filesystem_re) || std::regex_search(description, data_re)) {
        return ImageFormat::Raw;
    }
    return ImageFormat::Unknown;
}

bool looks_like_filesystem(const std::string& description) {
    return std::regex_search(description, sparse_re) || std::regex_search(description, filesystem_re);
}

bool looks_like_super(const std::string& description) {
    return std::regex_search(description, sparse_re) || std::regex_search(description, data_re);
}

ImageFile probe_image(const std::filesystem::path& path, const std::string& file_tool) {
    ImageFile image;
    image.path = path;
    image.size = ::file_size(path);

    auto result = exec_command({file_tool, "-b", path.string()});
    if (!result.ok()) {
        throw ToolError("'" + file_tool + "' failed on " + path.string() + ": " + trim(result.output));
    }
    image.description = trim(result.output);
    image.format = classify_description(image.description);
    return image;
}
