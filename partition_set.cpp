#include "partition_set.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

const std::vector<std::string>& known_partitions() {
    static const std::vector<std::string> names = {"system", "vendor", "product", "odm", "system_ext"};
    return names;
}

PartitionSet PartitionSet::scan(const fs::path& dir) {
    if (!fs::is_directory(dir)) {
        throw ValidationError("Extraction directory not found: " + dir.string());
    }

    std::vector<std::string> others;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".img") continue;
        std::string name = entry.path().stem().string();
        const auto& known = known_partitions();
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            others.push_back(name);
        }
    }
    std::sort(others.begin(), others.end());

    PartitionSet set;
    for (const auto& name : known_partitions()) {
        fs::path image = dir / (name + ".img");
        if (fs::is_regular_file(image)) {
            set.parts.push_back({name, image, ::file_size(image)});
        }
    }
    for (const auto& name : others) {
        fs::path image = dir / (name + ".img");
        set.parts.push_back({name, image, ::file_size(image)});
    }

    if (!set.contains("system")) {
        throw ValidationError("No system partition found in " + dir.string());
    }
    return set;
}

const PartitionSet::Entry* PartitionSet::find(const std::string& name) const {
    for (const auto& p : parts) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

void PartitionSet::refresh_sizes() {
    for (auto& p : parts) {
        p.size = ::file_size(p.image);
    }
}

void PartitionSet::mark_replaced(const std::string& name) {
    for (auto& p : parts) {
        if (p.name == name) {
            p.replaced = true;
            return;
        }
    }
    throw std::out_of_range("Unknown partition: " + name);
}

uint64_t PartitionSet::total_size() const {
    uint64_t total = 0;
    for (const auto& p : parts) {
        total += p.size;
    }
    return total;
}
