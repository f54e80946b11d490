#ifndef REPACK_PLAN_HPP
#define REPACK_PLAN_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include "config.hpp"
#include "partition_set.hpp"

// One "--partition name:attrs:size:group --image name=path" pair for lpmake.
struct PartitionDescriptor {
    std::string name;
    std::string attributes;
    uint64_t size;
    std::string group;
    std::filesystem::path image;
};

// Typed form of an lpmake invocation.
struct RepackPlan {
    RepackLayout layout;
    uint64_t device_size = 0;
    uint64_t group_size = 0;
    std::vector<PartitionDescriptor> partitions;
    bool sparse = true;
    std::filesystem::path output;

    // Every entry becomes a readonly partition in the single layout group,
    // which is sized like the device: sum of all partitions plus 20%.
    static RepackPlan from_partitions(const PartitionSet& set, const RepackLayout& layout,
                                      const std::filesystem::path& output);

    std::vector<std::string> to_args(const std::string& lpmake) const;
};

#endif // REPACK_PLAN_HPP
