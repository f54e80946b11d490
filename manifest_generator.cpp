#include "manifest_generator.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

static json image_json(const ImageFile& image) {
    return {
        {"path", image.path.string()},
        {"size", image.size},
        {"format", format_name(image.format)},
        {"type", image.description}
    };
}

json build_manifest(
    const ImageFile& super_image,
    const ImageFile& gsi,
    const ImageTransformer& transformer,
    const std::filesystem::path& output_file,
    const std::string& md5
) {
    json manifest;

    json inputs;
    inputs["super"] = image_json(super_image);
    inputs["system"] = image_json(gsi);
    manifest["inputs"] = inputs;

    const RepackPlan& plan = transformer.plan();
    json partitions_json = json::array();
    for (const auto& p : transformer.partitions().entries()) {
        partitions_json.push_back({
            {"name", p.name},
            {"size", p.size},
            {"replaced", p.replaced}
        });
    }

    json super_json;
    super_json["name"] = plan.layout.super_name;
    super_json["group"] = plan.layout.group_name;
    super_json["metadata_size"] = plan.layout.metadata_size;
    super_json["metadata_slots"] = plan.layout.metadata_slots;
    super_json["device_size"] = plan.device_size;
    super_json["sparse"] = plan.sparse;
    super_json["partitions"] = partitions_json;
    manifest["super"] = super_json;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&now), "%Y-%m-%dT%H:%M:%S");

    manifest["output"] = {
        {"file", output_file.filename().string()},
        {"md5", md5},
        {"created", ss.str()}
    };
    return manifest;
}

void write_manifest(const std::filesystem::path& manifest_path, const json& manifest) {
    std::ofstream out_f(manifest_path);
    if (!out_f) {
        throw std::runtime_error("Failed to create " + manifest_path.string());
    }
    out_f << manifest.dump(4);
    std::cout << "Manifest saved to " << manifest_path << std::endl;
}
