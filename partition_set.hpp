#ifndef PARTITION_SET_HPP
#define PARTITION_SET_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

// Partitions the tool knows by name, in repack order. `system` is mandatory.
const std::vector<std::string>& known_partitions();

// Logical partitions extracted from a super image, one "<name>.img" per entry.
class PartitionSet {
public:
    struct Entry {
        std::string name;
        std::filesystem::path image;
        uint64_t size;
        bool replaced = false;
    };

    // Collects every "*.img" in `dir`: known partitions first in their fixed
    // order, then any others sorted by name. Throws ValidationError when
    // system.img is absent.
    static PartitionSet scan(const std::filesystem::path& dir);

    const std::vector<Entry>& entries() const { return parts; }
    const Entry* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Re-reads every entry's byte size from disk.
    void refresh_sizes();
    void mark_replaced(const std::string& name);

    uint64_t total_size() const;

    // Sum of all partitions plus a 20% margin, in integer arithmetic.
    static uint64_t container_size(uint64_t total) { return total + total / 5; }

private:
    std::vector<Entry> parts;
};

#endif // PARTITION_SET_HPP
