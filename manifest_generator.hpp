#ifndef MANIFEST_GENERATOR_HPP
#define MANIFEST_GENERATOR_HPP

#include <string>
#include <filesystem>
#include "image_probe.hpp"
#include "image_transformer.hpp"
#include "utils.hpp"

json build_manifest(
    const ImageFile& super_image,
    const ImageFile& gsi,
    const ImageTransformer& transformer,
    const std::filesystem::path& output_file,
    const std::string& md5
);

void write_manifest(const std::filesystem::path& manifest_path, const json& manifest);

#endif // MANIFEST_GENERATOR_HPP
