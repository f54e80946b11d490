#include "repack_plan.hpp"

RepackPlan RepackPlan::from_partitions(const PartitionSet& set, const RepackLayout& layout,
                                       const std::filesystem::path& output) {
    RepackPlan plan;
    plan.layout = layout;
    plan.device_size = PartitionSet::container_size(set.total_size());
    plan.group_size = plan.device_size;
    plan.output = output;

    for (const auto& entry : set.entries()) {
        plan.partitions.push_back({entry.name, "readonly", entry.size, layout.group_name, entry.image});
    }
    return plan;
}

std::vector<std::string> RepackPlan::to_args(const std::string& lpmake) const {
    std::vector<std::string> args = {
        lpmake,
        "--metadata-size", std::to_string(layout.metadata_size),
        "--super-name", layout.super_name,
        "--metadata-slots", std::to_string(layout.metadata_slots),
        "--device", layout.super_name + ":" + std::to_string(device_size),
        "--group", layout.group_name + ":" + std::to_string(group_size),
    };

    for (const auto& p : partitions) {
        args.push_back("--partition");
        args.push_back(p.name + ":" + p.attributes + ":" + std::to_string(p.size) + ":" + p.group);
        args.push_back("--image");
        args.push_back(p.name + "=" + p.image.string());
    }

    if (sparse) {
        args.push_back("--sparse");
    }
    args.push_back("--output");
    args.push_back(output.string());
    return args;
}
